#include "revgate_data/serialization.h"

#include "revgate/log.h"

#include <exception>
#include <fstream>
#include <string>
#include <utility>

namespace revgate::data {

bool append_json_line(const std::filesystem::path& path, const nlohmann::json& record) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::app);
  if (!out) {
    revgate::log::warn(std::string("JSON append failed: ") + path.string());
    return false;
  }
  try {
    out << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  } catch (const std::exception& e) {
    revgate::log::warn(std::string("JSON serialize failed: ") + e.what());
    return false;
  }
  return static_cast<bool>(out);
}

bool load_json_lines(const std::filesystem::path& path, std::vector<nlohmann::json>& out) {
  std::ifstream in(path);
  if (!in) {
    revgate::log::warn(std::string("JSON read failed: ") + path.string());
    return false;
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      revgate::log::warn(std::string("JSON parse failed: ") + path.string());
      return false;
    }
    out.push_back(std::move(j));
  }
  return true;
}

} // namespace revgate::data
