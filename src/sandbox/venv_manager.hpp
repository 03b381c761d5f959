#pragma once

#include <filesystem>

#include "sandbox/command_builder.hpp"
#include "sandbox/exec_result.hpp"

namespace pyrunner::sandbox {

class VenvManager {
public:
    VenvManager(const CommandBuilder& builder, CommandRunner& runner);

    // Creates <user_root>/.venv with system site packages visible unless an
    // interpreter is already there. Throws SetupError when creation fails.
    void EnsureVenv(const std::filesystem::path& user_root);

    static bool HasVenv(const std::filesystem::path& user_root);

private:
    const CommandBuilder& builder_;
    CommandRunner& runner_;
};

}  // namespace pyrunner::sandbox
