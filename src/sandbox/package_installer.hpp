#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/command_builder.hpp"
#include "sandbox/exec_result.hpp"

namespace pyrunner::sandbox {

class PackageInstaller {
public:
    PackageInstaller(const CommandBuilder& builder, CommandRunner& runner);

    // Probes every specifier with `pip show` and installs the missing ones in
    // a single `pip install`. Throws SetupError if that install fails.
    void PipInstall(const std::filesystem::path& user_root, const std::vector<std::string>& specs);

    // Specifiers pip show does not report as installed. Probe failures count
    // as missing.
    std::vector<std::string> MissingPackages(const std::filesystem::path& user_root,
                                             const std::vector<std::string>& specs);

private:
    bool IsInstalled(const std::filesystem::path& user_root, const std::string& name);

    const CommandBuilder& builder_;
    CommandRunner& runner_;
};

// "numpy==1.2" -> "numpy", "'requests[socks]>=2'" -> "requests". nullopt when
// nothing usable is left.
std::optional<std::string> ExtractPackageName(const std::string& spec);

}  // namespace pyrunner::sandbox
