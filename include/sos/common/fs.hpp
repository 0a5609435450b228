#pragma once

#include "sos/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sos::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
/// Strips trailing '\n' and '\r' only; other whitespace is output.
[[nodiscard]] std::string trim_trailing_newlines(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
/// Creates a fresh directory `<parent>/<prefix><random>`.
[[nodiscard]] Result<std::filesystem::path> make_unique_dir(const std::filesystem::path &parent,
                                                           const std::string &prefix);

} // namespace sos::common
