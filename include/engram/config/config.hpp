#pragma once

#include "engram/common/result.hpp"
#include "engram/common/toml.hpp"
#include "engram/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace engram::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Builds a Config from an already parsed document; keys that are absent keep their defaults.
[[nodiscard]] common::Result<Config> config_from_toml(const common::TomlDocument &doc);
[[nodiscard]] std::string config_to_toml(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors come back as a failure, soft problems as the warning list.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace engram::config
