#pragma once

#include "sos/common/result.hpp"
#include "sos/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sos::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then the TOML file (if present), then environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Applies SOS_* environment variables (after loading .env files).
void apply_env_overrides(Config &config);

/// Hard errors fail; the success value carries non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// TOML rendering of the effective configuration.
[[nodiscard]] std::string render_config(const Config &config);

} // namespace sos::config
