#pragma once

#include "warden/common/result.hpp"
#include "warden/common/toml.hpp"
#include "warden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();

/// Applies a parsed document on top of the defaults; exposed for tests.
[[nodiscard]] common::Result<Config> config_from_toml(const common::TomlDocument &doc);

/// Returns warnings on success; the first hard problem on failure.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace warden::config
