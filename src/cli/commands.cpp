#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "agent/tools/python_exec.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_loader.hpp"
#include "sandbox/package_installer.hpp"
#include "sandbox/process_executor.hpp"
#include "sandbox/user_workspace.hpp"
#include "sandbox/venv_manager.hpp"

namespace {

struct CliArgs {
    std::string command;
    std::string user_id;
    std::string conversation_id;
    std::string timeout_ms;
    std::vector<std::string> pip;
    std::vector<std::string> return_files;
    std::vector<std::string> positional;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  pyrunner_cli exec --user ID [--conversation ID] [--timeout-ms N]\n"
              << "                    [--pip SPEC]... [--return-file PATH]... SCRIPT|-\n"
              << "  pyrunner_cli venv --user ID\n"
              << "  pyrunner_cli pip --user ID SPEC...\n"
              << "  pyrunner_cli tools" << std::endl;
}

std::optional<CliArgs> ParseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliArgs args{};
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                return false;
            }
            target = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--user") {
            if (!next(args.user_id)) {
                return std::nullopt;
            }
        } else if (arg == "--conversation") {
            if (!next(args.conversation_id)) {
                return std::nullopt;
            }
        } else if (arg == "--timeout-ms") {
            if (!next(args.timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--pip") {
            if (!next(value)) {
                return std::nullopt;
            }
            args.pip.push_back(value);
        } else if (arg == "--return-file") {
            if (!next(value)) {
                return std::nullopt;
            }
            args.return_files.push_back(value);
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

std::optional<std::string> ReadScript(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

int RunExec(const pyrunner::config::Config& config, const CliArgs& args) {
    if (args.user_id.empty() || args.positional.size() != 1) {
        PrintUsage();
        return 1;
    }
    const auto code = ReadScript(args.positional.front());
    if (!code) {
        std::cout << "Failed to read " << args.positional.front() << std::endl;
        return 1;
    }

    pyrunner::sandbox::ProcessExecutor executor;
    pyrunner::agent::tools::ToolRegistry tools;
    tools.Register(std::make_unique<pyrunner::agent::tools::PythonExecTool>(
        config, executor, pyrunner::sandbox::EnvSnapshot::FromProcess()));

    std::unordered_map<std::string, std::string> params{
        {"code", *code},
        {"user_id", args.user_id},
        {"conversation_id", args.conversation_id},
        {"timeout_ms", args.timeout_ms},
        {"pip", nlohmann::json(args.pip).dump()},
        {"return_files", nlohmann::json(args.return_files).dump()}
    };
    const auto result = tools.Execute("python_exec", params);
    std::cout << result << std::endl;
    return result.rfind("Error:", 0) == 0 ? 1 : 0;
}

int RunSetup(const pyrunner::config::Config& config, const CliArgs& args) {
    if (args.user_id.empty()) {
        PrintUsage();
        return 1;
    }
    pyrunner::sandbox::ProcessExecutor executor;
    pyrunner::sandbox::CommandBuilder builder(config.runner, pyrunner::sandbox::EnvSnapshot::FromProcess());
    pyrunner::sandbox::UserWorkspace workspace(config.runner.workspace_root, args.user_id);
    try {
        workspace.EnsureRoot();
        pyrunner::sandbox::VenvManager venv(builder, executor);
        venv.EnsureVenv(workspace.Root());
        if (args.command == "pip") {
            pyrunner::sandbox::PackageInstaller installer(builder, executor);
            installer.PipInstall(workspace.Root(), args.positional);
        }
    } catch (const pyrunner::sandbox::SetupError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cout << "Workspace unavailable: " << ex.what() << std::endl;
        return 1;
    }
    std::cout << workspace.Root().string() << std::endl;
    return 0;
}

int ListTools(const pyrunner::config::Config& config) {
    pyrunner::sandbox::ProcessExecutor executor;
    pyrunner::agent::tools::ToolRegistry tools;
    tools.Register(std::make_unique<pyrunner::agent::tools::PythonExecTool>(
        config, executor, pyrunner::sandbox::EnvSnapshot::FromProcess()));
    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : tools.GetDefinitions()) {
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const auto args = ParseArgs(argc, argv);
    if (!args) {
        PrintUsage();
        return 1;
    }

    pyrunner::config::Config config;
    try {
        config = pyrunner::config::LoadConfig();
    } catch (const pyrunner::config::ConfigError& ex) {
        std::cerr << "[config] ERROR " << ex.what() << std::endl;
        return 2;
    }
    pyrunner::utils::ApplyLogConfig(config.log);

    if (args->command == "exec") {
        return RunExec(config, *args);
    }
    if (args->command == "venv" || args->command == "pip") {
        return RunSetup(config, *args);
    }
    if (args->command == "tools") {
        return ListTools(config);
    }
    PrintUsage();
    return 1;
}
