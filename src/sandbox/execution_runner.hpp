#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "sandbox/command_builder.hpp"
#include "sandbox/exec_result.hpp"

namespace pyrunner::sandbox {

inline constexpr const char* kEntryScript = "main.py";

class ExecutionRunner {
public:
    ExecutionRunner(const CommandBuilder& builder, CommandRunner& runner);

    // Runs main.py from conversation_dir with the user's venv interpreter.
    // conversation_dir must lie under user_root (std::invalid_argument
    // otherwise). The result is whatever the runner reports, 124 on timeout;
    // a timed-out container is force-removed by name.
    ExecResult ExecPython(const std::filesystem::path& user_root,
                          const std::filesystem::path& conversation_dir,
                          std::chrono::milliseconds timeout);

private:
    void RemoveContainer(const std::string& container_name);

    const CommandBuilder& builder_;
    CommandRunner& runner_;
};

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

}  // namespace pyrunner::sandbox
