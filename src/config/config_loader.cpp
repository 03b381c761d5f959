#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

#include "utils/common.hpp"

namespace pyrunner::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto overridden = GetEnv("PYRUNNER_CONFIG");
    if (!overridden.empty()) {
        return ExpandHome(overridden);
    }
    return GetHomePath() / ".pyrunner" / "config.json";
}

void ReadString(const nlohmann::json& section, const char* key, const std::string& where,
                std::string& target) {
    if (!section.contains(key)) {
        return;
    }
    if (!section[key].is_string()) {
        throw ConfigError(where + "." + key + " must be a string");
    }
    target = section[key].get<std::string>();
}

void ReadBool(const nlohmann::json& section, const char* key, const std::string& where,
              bool& target) {
    if (!section.contains(key)) {
        return;
    }
    if (!section[key].is_boolean()) {
        throw ConfigError(where + "." + key + " must be a boolean");
    }
    target = section[key].get<bool>();
}

template <typename Int>
void ReadInt(const nlohmann::json& section, const char* key, const std::string& where,
             Int& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        throw ConfigError(where + "." + key + " must be an integer");
    }
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
    } else {
        const auto wide = value.get<std::int64_t>();
        in_range = wide >= std::numeric_limits<Int>::min() && wide <= std::numeric_limits<Int>::max();
    }
    if (!in_range) {
        throw ConfigError(where + "." + key + " is out of range: " + value.dump());
    }
    target = value.get<Int>();
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("config root must be an object");
    }

    if (data.contains("runner")) {
        const auto& runner = data["runner"];
        if (!runner.is_object()) {
            throw ConfigError("runner must be an object");
        }
        auto& target = config.runner;
        ReadString(runner, "containerCli", "runner", target.container_cli);
        ReadString(runner, "image", "runner", target.image);
        ReadString(runner, "workspaceRoot", "runner", target.workspace_root);
        ReadString(runner, "user", "runner", target.user);
        ReadBool(runner, "readOnlyRoot", "runner", target.read_only_root);
        ReadString(runner, "cpus", "runner", target.cpus);
        ReadString(runner, "memory", "runner", target.memory);
        ReadString(runner, "extraRunArgs", "runner", target.extra_run_args);
        ReadBool(runner, "denyNetworkAtExec", "runner", target.deny_network_at_exec);
        ReadString(runner, "hostAlias", "runner", target.host_alias);
        ReadInt(runner, "bootstrapTimeoutS", "runner", target.bootstrap_timeout_s);
        ReadInt(runner, "probeTimeoutS", "runner", target.probe_timeout_s);
        ReadInt(runner, "installTimeoutS", "runner", target.install_timeout_s);
    }

    if (data.contains("tool")) {
        const auto& tool = data["tool"];
        if (!tool.is_object()) {
            throw ConfigError("tool must be an object");
        }
        ReadBool(tool, "enabled", "tool", config.tool.enabled);
        ReadBool(tool, "allowPip", "tool", config.tool.allow_pip);
        ReadInt(tool, "defaultTimeoutMs", "tool", config.tool.default_timeout_ms);
        ReadInt(tool, "maxTimeoutMs", "tool", config.tool.max_timeout_ms);
        ReadInt(tool, "maxOutputBytes", "tool", config.tool.max_output_bytes);
    }

    if (data.contains("logLevel")) {
        if (!data["logLevel"].is_string()) {
            throw ConfigError("logLevel must be a string");
        }
        config.log.min_level = utils::ParseLogLevel(
            data["logLevel"].get<std::string>(), config.log.min_level);
    }
}

bool ParseBool(const std::string& name, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigError(name + " is not a boolean: " + value);
}

long ParseLong(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(name + " is not an integer: " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError(name + " is not an integer: " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError(name + " is out of range: " + value);
    }
}

void OverrideString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideBool(const char* primary, const char* secondary, bool& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(primary, value);
    }
}

template <typename Int>
void OverrideInt(const char* primary, const char* secondary, Int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        const auto parsed = ParseLong(primary, value);
        if (parsed < static_cast<long>(std::numeric_limits<Int>::min()) ||
            parsed > static_cast<long>(std::numeric_limits<Int>::max())) {
            throw ConfigError(std::string(primary) + " is out of range: " + value);
        }
        target = static_cast<Int>(parsed);
    }
}

void ApplyEnvOverrides(Config& config) {
    auto& runner = config.runner;
    OverrideString("PYRUNNER_RUNNER__CONTAINER_CLI", "PYRUNNER_CONTAINER_CLI", runner.container_cli);
    OverrideString("PYRUNNER_RUNNER__IMAGE", "PYRUNNER_IMAGE", runner.image);
    OverrideString("PYRUNNER_RUNNER__WORKSPACE_ROOT", "PYRUNNER_WORKSPACE_ROOT", runner.workspace_root);
    OverrideString("PYRUNNER_RUNNER__USER", "PYRUNNER_USER", runner.user);
    OverrideBool("PYRUNNER_RUNNER__READ_ONLY_ROOT", "PYRUNNER_READ_ONLY_ROOT", runner.read_only_root);
    OverrideString("PYRUNNER_RUNNER__CPUS", "PYRUNNER_CPUS", runner.cpus);
    OverrideString("PYRUNNER_RUNNER__MEMORY", "PYRUNNER_MEMORY", runner.memory);
    OverrideString("PYRUNNER_RUNNER__EXTRA_RUN_ARGS", "PYRUNNER_EXTRA_RUN_ARGS", runner.extra_run_args);
    OverrideBool("PYRUNNER_RUNNER__DENY_NETWORK_AT_EXEC", "PYRUNNER_DENY_NETWORK_AT_EXEC",
                 runner.deny_network_at_exec);
    OverrideString("PYRUNNER_RUNNER__HOST_ALIAS", "PYRUNNER_HOST_ALIAS", runner.host_alias);
    OverrideInt("PYRUNNER_RUNNER__BOOTSTRAP_TIMEOUT_S", "PYRUNNER_BOOTSTRAP_TIMEOUT_S",
                runner.bootstrap_timeout_s);
    OverrideInt("PYRUNNER_RUNNER__PROBE_TIMEOUT_S", "PYRUNNER_PROBE_TIMEOUT_S", runner.probe_timeout_s);
    OverrideInt("PYRUNNER_RUNNER__INSTALL_TIMEOUT_S", "PYRUNNER_INSTALL_TIMEOUT_S",
                runner.install_timeout_s);

    OverrideBool("PYRUNNER_TOOL__ENABLED", "PYRUNNER_TOOL_ENABLED", config.tool.enabled);
    OverrideBool("PYRUNNER_TOOL__ALLOW_PIP", "PYRUNNER_ALLOW_PIP", config.tool.allow_pip);
    OverrideInt("PYRUNNER_TOOL__DEFAULT_TIMEOUT_MS", "PYRUNNER_DEFAULT_TIMEOUT_MS",
                config.tool.default_timeout_ms);
    OverrideInt("PYRUNNER_TOOL__MAX_TIMEOUT_MS", "PYRUNNER_MAX_TIMEOUT_MS", config.tool.max_timeout_ms);
    OverrideInt("PYRUNNER_TOOL__MAX_OUTPUT_BYTES", "PYRUNNER_MAX_OUTPUT_BYTES",
                config.tool.max_output_bytes);

    const auto log_level = GetEnv("PYRUNNER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.min_level = utils::ParseLogLevel(log_level, config.log.min_level);
    }
}

void Validate(const Config& config) {
    const auto& runner = config.runner;
    if (utils::IsBlank(runner.container_cli)) {
        throw ConfigError("runner.containerCli must not be blank");
    }
    if (utils::IsBlank(runner.image)) {
        throw ConfigError("runner.image must not be blank");
    }
    if (utils::IsBlank(runner.workspace_root)) {
        throw ConfigError("runner.workspaceRoot must not be blank");
    }
    if (utils::IsBlank(runner.cpus) || utils::IsBlank(runner.memory)) {
        throw ConfigError("runner.cpus and runner.memory must not be blank");
    }
    if (utils::IsBlank(runner.host_alias)) {
        throw ConfigError("runner.hostAlias must not be blank");
    }
    if (runner.bootstrap_timeout_s <= 0 || runner.probe_timeout_s <= 0 || runner.install_timeout_s <= 0) {
        throw ConfigError("runner timeouts must be positive");
    }
    if (config.tool.max_timeout_ms <= 0 || config.tool.max_output_bytes <= 0) {
        throw ConfigError("tool.maxTimeoutMs and tool.maxOutputBytes must be positive");
    }
}

}  // namespace

std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw ConfigError("cannot open config file " + path.string());
        }
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            throw ConfigError("malformed config file " + path.string());
        }
        ApplyConfigFromJson(config, data);
    }

    ApplyEnvOverrides(config);
    config.runner.workspace_root = ExpandHome(config.runner.workspace_root).string();
    Validate(config);
    return config;
}

}  // namespace pyrunner::config
