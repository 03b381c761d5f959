#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"

namespace pyrunner::config {

// Deployment misconfiguration: unreadable or malformed profile, bad override.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads $PYRUNNER_CONFIG, or ~/.pyrunner/config.json when unset.
Config LoadConfig();

// A missing file yields defaults; environment overrides apply either way.
Config LoadConfig(const std::filesystem::path& path);

std::filesystem::path ExpandHome(const std::string& path);

}  // namespace pyrunner::config
