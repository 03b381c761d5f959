#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/exec_result.hpp"

namespace pyrunner::sandbox {

// Spawns argv directly (no shell), drains stdout and stderr on two reader
// threads and force-kills the child once the timeout expires.
class ProcessExecutor : public CommandRunner {
public:
    ExecResult Run(const std::vector<std::string>& argv,
                   std::chrono::milliseconds timeout) override;
};

}  // namespace pyrunner::sandbox
