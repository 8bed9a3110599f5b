#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace pysandbox::config {

// $PYSANDBOX_CONFIG, else ~/.pysandbox/config.json.
std::filesystem::path GetConfigPath();

// File first, then environment overrides.
Config LoadConfig();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace pysandbox::config
