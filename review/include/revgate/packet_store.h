#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace revgate {

class PacketStore {
 public:
  PacketStore(std::filesystem::path reviews_dir, std::string extension);

  std::filesystem::path locate(const std::string& branch) const;
  bool exists(const std::filesystem::path& location) const;

  // std::nullopt when no packet exists at location or it cannot be read.
  std::optional<std::vector<std::string>> read(const std::filesystem::path& location,
                                               std::string* error) const;
  bool write(const std::filesystem::path& location,
             const std::vector<std::string>& lines,
             std::string* error) const;

  const std::filesystem::path& reviews_dir() const { return reviews_dir_; }

 private:
  std::filesystem::path reviews_dir_;
  std::string extension_;
};

} // namespace revgate
