#pragma once

#include <chrono>
#include <string>

#include "agent/tools/tool.hpp"
#include "config/config_schema.hpp"
#include "sandbox/command_builder.hpp"
#include "sandbox/execution_runner.hpp"
#include "sandbox/package_installer.hpp"
#include "sandbox/venv_manager.hpp"

namespace pyrunner::agent::tools {

// python_exec: writes the agent's code as main.py into the conversation
// directory of the user's workspace, prepares the venv and runs it in a
// throwaway container.
class PythonExecTool : public Tool {
public:
    PythonExecTool(config::Config config, sandbox::CommandRunner& runner, sandbox::EnvSnapshot env);

    std::string Name() const override { return "python_exec"; }
    std::string Description() const override {
        return "Run short Python 3 code in an isolated container and return stdout/stderr. "
               "Use for quick computation or parsing.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

    // Used when the call itself carries no user_id / conversation_id.
    void SetContext(const std::string& user_id, const std::string& conversation_id);

    std::chrono::milliseconds ClampTimeout(const std::string& requested) const;

private:
    config::Config config_;
    sandbox::CommandBuilder builder_;
    sandbox::VenvManager venv_;
    sandbox::PackageInstaller installer_;
    sandbox::ExecutionRunner executor_;
    std::string default_user_id_;
    std::string default_conversation_id_;
};

}  // namespace pyrunner::agent::tools
