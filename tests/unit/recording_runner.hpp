#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <unistd.h>

#include "sandbox/exec_result.hpp"

namespace pyrunner::testing {

struct RecordedCall {
    std::vector<std::string> argv;
    std::chrono::milliseconds timeout;
};

// Records every argument vector instead of spawning anything.
class RecordingRunner : public sandbox::CommandRunner {
public:
    using Handler = std::function<sandbox::ExecResult(const std::vector<std::string>&)>;

    sandbox::ExecResult Run(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) override {
        calls.push_back({argv, timeout});
        if (handler) {
            return handler(argv);
        }
        return sandbox::ExecResult{0, {}, {}};
    }

    std::vector<RecordedCall> calls;
    Handler handler;
};

inline bool Contains(const std::vector<std::string>& argv, const std::string& token) {
    return std::find(argv.begin(), argv.end(), token) != argv.end();
}

// Value following flag, or empty when the flag is absent.
inline std::string FlagValue(const std::vector<std::string>& argv, const std::string& flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || std::next(it) == argv.end()) {
        return {};
    }
    return *std::next(it);
}

inline bool HasPair(const std::vector<std::string>& argv, const std::string& first, const std::string& second) {
    for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
        if (argv[i] == first && argv[i + 1] == second) {
            return true;
        }
    }
    return false;
}

// Everything after the image, i.e. the command run inside the container.
inline std::vector<std::string> ContainerCommand(const std::vector<std::string>& argv, const std::string& image) {
    auto it = std::find(argv.begin(), argv.end(), image);
    if (it == argv.end()) {
        return {};
    }
    return std::vector<std::string>(std::next(it), argv.end());
}

// Host side of the "-v <host>:/ws" mount.
inline std::filesystem::path MountedRoot(const std::vector<std::string>& argv) {
    const auto mount = FlagValue(argv, "-v");
    const auto pos = mount.rfind(":/ws");
    return pos == std::string::npos ? std::filesystem::path() : std::filesystem::path(mount.substr(0, pos));
}

inline std::filesystem::path MakeTempDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() /
        ("pyrunner_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace pyrunner::testing
