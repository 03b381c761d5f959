#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyrunner::sandbox {

inline constexpr int kTimeoutExitCode = 124;
inline constexpr int kLaunchFailureExitCode = 1;

struct ExecResult {
    int exit_code = -1;
    std::string output;
    std::string error;
};

// Runs one fully built argument vector. Implementations never throw.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ExecResult Run(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout) = 0;
};

// A venv bootstrap or package install exited non-zero.
class SetupError : public std::runtime_error {
public:
    SetupError(const std::string& what, int exit_code, std::string error_output)
        : std::runtime_error(what),
          exit_code_(exit_code),
          error_output_(std::move(error_output)) {}

    int ExitCode() const { return exit_code_; }
    const std::string& ErrorOutput() const { return error_output_; }

private:
    int exit_code_;
    std::string error_output_;
};

}  // namespace pyrunner::sandbox
