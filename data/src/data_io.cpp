#include "revgate_data/serialization.h"

#include "revgate/log.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace revgate::data {

std::optional<std::string> read_text_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    revgate::log::warn(std::string("failed to read file: ") + path.string());
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents,
                     std::string* error) {
  namespace fs = std::filesystem;
  auto fail = [&](const std::string& message) {
    revgate::log::warn(message);
    if (error) *error = message;
    return false;
  };

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return fail("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  fs::path tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail("failed to write file: " + tmp_path.string());
    }
    out << contents;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp_path, ec);
      return fail("failed to write file: " + tmp_path.string());
    }
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    const std::string message = "failed to replace " + path.string() + ": " + ec.message();
    std::error_code rm_ec;
    fs::remove(tmp_path, rm_ec);
    return fail(message);
  }
  return true;
}

} // namespace revgate::data
