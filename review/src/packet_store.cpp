#include "revgate/packet_store.h"

#include "revgate/branch_naming.h"
#include "revgate/packet.h"
#include "revgate_data/serialization.h"

#include <system_error>
#include <utility>

namespace revgate {

PacketStore::PacketStore(std::filesystem::path reviews_dir, std::string extension)
    : reviews_dir_(std::move(reviews_dir)), extension_(std::move(extension)) {}

std::filesystem::path PacketStore::locate(const std::string& branch) const {
  return reviews_dir_ / (sanitize_branch_name(branch) + extension_);
}

bool PacketStore::exists(const std::filesystem::path& location) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(location, ec) && !ec;
}

std::optional<std::vector<std::string>> PacketStore::read(const std::filesystem::path& location,
                                                          std::string* error) const {
  if (error) error->clear();
  if (!exists(location)) {
    if (error) *error = "Review packet not found: " + location.string();
    return std::nullopt;
  }
  const auto text = data::read_text_file(location);
  if (!text.has_value()) {
    if (error) *error = "Review packet could not be read: " + location.string();
    return std::nullopt;
  }
  return split_packet_text(*text);
}

bool PacketStore::write(const std::filesystem::path& location,
                        const std::vector<std::string>& lines,
                        std::string* error) const {
  return data::write_text_file(location, join_packet_lines(lines), error);
}

} // namespace revgate
