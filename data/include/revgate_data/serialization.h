#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace revgate::data {

std::optional<std::string> read_text_file(const std::filesystem::path& path);

// Writes through a sibling temporary file renamed over the target, so a failed
// write never leaves a truncated file behind. Parent directories are created.
bool write_text_file(const std::filesystem::path& path, const std::string& contents,
                     std::string* error = nullptr);

bool append_json_line(const std::filesystem::path& path, const nlohmann::json& record);
bool load_json_lines(const std::filesystem::path& path, std::vector<nlohmann::json>& out);

} // namespace revgate::data
