#include "sandbox/command_builder.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace pyrunner::sandbox {

CommandBuilder::CommandBuilder(config::RunnerConfig config, EnvSnapshot env)
    : config_(std::move(config)),
      env_(std::move(env)) {}

std::vector<std::string> CommandBuilder::Build(const std::filesystem::path& user_root,
                                               const Phase& phase) const {
    const auto* execute = std::get_if<ExecutePhase>(&phase);
    std::vector<std::string> argv = {
        config_.container_cli,
        "run",
        "--rm",
        "-v", NormalizeDir(user_root).string() + ":" + kContainerMount,
        "--cpus", config_.cpus,
        "--memory", config_.memory
    };
    if (execute && !execute->container_name.empty()) {
        argv.push_back("--name");
        argv.push_back(execute->container_name);
    }
    if (config_.read_only_root) {
        argv.push_back("--read-only");
    }
    if (!utils::IsBlank(config_.user)) {
        argv.push_back("-u");
        argv.push_back(utils::Trim(config_.user));
    }
    for (auto& flag : utils::SplitWhitespace(config_.extra_run_args)) {
        argv.push_back(std::move(flag));
    }
    AppendProxyEnv(argv);

    if (execute) {
        if (config_.deny_network_at_exec) {
            argv.push_back("--network");
            argv.push_back("none");
        }
        argv.push_back("-w");
        argv.push_back(ContainerWorkdir(user_root, execute->conversation_dir));
    }

    argv.push_back(config_.image);
    return argv;
}

void CommandBuilder::AppendProxyEnv(std::vector<std::string>& argv) const {
    auto forward = [&argv](const char* upper, const char* lower, const std::string& value) {
        if (utils::IsBlank(value)) {
            return;
        }
        argv.push_back("-e");
        argv.push_back(std::string(upper) + "=" + value);
        argv.push_back("-e");
        argv.push_back(std::string(lower) + "=" + value);
    };
    forward("HTTP_PROXY", "http_proxy", AdaptProxyForContainer(env_.http_proxy, config_.host_alias));
    forward("HTTPS_PROXY", "https_proxy", AdaptProxyForContainer(env_.https_proxy, config_.host_alias));
    // Host lists, not URLs: forwarded as-is.
    forward("NO_PROXY", "no_proxy", env_.no_proxy);
}

std::filesystem::path NormalizeDir(const std::filesystem::path& dir) {
    auto normal = std::filesystem::absolute(dir).lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

std::string ContainerWorkdir(const std::filesystem::path& user_root,
                             const std::filesystem::path& conversation_dir) {
    const auto relative = NormalizeDir(conversation_dir).lexically_relative(NormalizeDir(user_root));
    std::string sub = relative.generic_string();
    std::replace(sub.begin(), sub.end(), '\\', '/');
    if (sub.empty() || sub == ".") {
        return kContainerMount;
    }
    std::string workdir = std::string(kContainerMount) + "/" + sub;
    while (workdir.size() > 1 && workdir.back() == '/') {
        workdir.pop_back();
    }
    return workdir;
}

}  // namespace pyrunner::sandbox
