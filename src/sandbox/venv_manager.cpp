#include "sandbox/venv_manager.hpp"

#include "utils/logging.hpp"

namespace pyrunner::sandbox {

VenvManager::VenvManager(const CommandBuilder& builder, CommandRunner& runner)
    : builder_(builder),
      runner_(runner) {}

bool VenvManager::HasVenv(const std::filesystem::path& user_root) {
    std::error_code ec;
    const auto venv = user_root / ".venv";
    return std::filesystem::exists(venv / "bin" / "python", ec) ||
        std::filesystem::exists(venv / "Scripts" / "python.exe", ec);
}

void VenvManager::EnsureVenv(const std::filesystem::path& user_root) {
    if (HasVenv(user_root)) {
        return;
    }
    utils::Log(utils::LogLevel::kInfo, "venv", "creating venv under " + user_root.string());

    auto argv = builder_.Build(user_root, InstallPhase{});
    argv.insert(argv.end(), {
        "python", "-X", "utf8",
        "-m", "venv",
        "--system-site-packages",
        std::string(kContainerMount) + "/.venv"
    });

    const auto timeout = std::chrono::seconds(builder_.Config().bootstrap_timeout_s);
    const auto result = runner_.Run(argv, timeout);
    if (result.exit_code != 0) {
        utils::Log(utils::LogLevel::kError, "venv",
                   "create venv failed exit=" + std::to_string(result.exit_code) + "\n" + result.error);
        throw SetupError("create venv failed: " + result.error, result.exit_code, result.error);
    }
}

}  // namespace pyrunner::sandbox
