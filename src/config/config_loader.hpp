#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace coderun::config {

// Defaults, then ~/.coderun/config.json (or $CODERUN_CONFIG), then
// CODERUN_* environment overrides.
Config LoadConfig();

// Defaults overlaid with a single JSON file; no environment lookups.
Config LoadConfigFromFile(const std::filesystem::path& path);

}  // namespace coderun::config
