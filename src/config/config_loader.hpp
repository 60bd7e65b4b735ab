#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace hoya::config {

// ~/.hoya/config.json, then HOYA_* environment overrides.
Config LoadConfig();
Config LoadConfigFromFile(const std::filesystem::path& path);
void ApplyEnvOverrides(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace hoya::config
