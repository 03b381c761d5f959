#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/proxy_env.hpp"

namespace pyrunner::sandbox {

inline constexpr const char* kContainerMount = "/ws";
inline constexpr const char* kContainerPython = "/ws/.venv/bin/python";

// Venv bootstrap, dependency probe and pip install: network stays on.
struct InstallPhase {};

// Untrusted code: network off when configured, runs in the conversation dir.
// A non-empty container_name is passed as --name so the container can be
// removed if its client is killed.
struct ExecutePhase {
    std::filesystem::path conversation_dir;
    std::string container_name;
};

using Phase = std::variant<InstallPhase, ExecutePhase>;

class CommandBuilder {
public:
    CommandBuilder(config::RunnerConfig config, EnvSnapshot env);

    // Everything up to and including the image; callers append the command
    // to run inside the container.
    std::vector<std::string> Build(const std::filesystem::path& user_root, const Phase& phase) const;

    const config::RunnerConfig& Config() const { return config_; }

private:
    void AppendProxyEnv(std::vector<std::string>& argv) const;

    config::RunnerConfig config_;
    EnvSnapshot env_;
};

// Absolute and lexically normal, without a trailing separator.
std::filesystem::path NormalizeDir(const std::filesystem::path& dir);

// "/ws/<conversation_dir relative to user_root>" with '/' separators.
std::string ContainerWorkdir(const std::filesystem::path& user_root,
                             const std::filesystem::path& conversation_dir);

}  // namespace pyrunner::sandbox
