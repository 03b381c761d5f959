#include "sandbox/package_installer.hpp"

#include <cctype>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyrunner::sandbox {
namespace {

using utils::LogLevel;

constexpr const char* kNameSeparators = "<>=!~[";

std::vector<std::string> PipCommand(const CommandBuilder& builder,
                                    const std::filesystem::path& user_root) {
    auto argv = builder.Build(user_root, InstallPhase{});
    argv.insert(argv.end(), {kContainerPython, "-X", "utf8", "-m", "pip"});
    return argv;
}

}  // namespace

std::optional<std::string> ExtractPackageName(const std::string& spec) {
    std::string name = utils::Trim(spec);
    std::size_t cut = name.size();
    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::isspace(c) || std::string(kNameSeparators).find(name[i]) != std::string::npos) {
            cut = i;
            break;
        }
    }
    name.resize(cut);
    if (!name.empty() && (name.front() == '\'' || name.front() == '"')) {
        name.erase(0, 1);
    }
    if (!name.empty() && (name.back() == '\'' || name.back() == '"')) {
        name.pop_back();
    }
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

PackageInstaller::PackageInstaller(const CommandBuilder& builder, CommandRunner& runner)
    : builder_(builder),
      runner_(runner) {}

bool PackageInstaller::IsInstalled(const std::filesystem::path& user_root, const std::string& name) {
    // Runs in the install phase, so the network stays on even though pip show
    // only reads site-packages.
    auto argv = PipCommand(builder_, user_root);
    argv.push_back("show");
    argv.push_back(name);
    const auto result = runner_.Run(argv, std::chrono::seconds(builder_.Config().probe_timeout_s));
    return result.exit_code == 0;
}

std::vector<std::string> PackageInstaller::MissingPackages(const std::filesystem::path& user_root,
                                                           const std::vector<std::string>& specs) {
    std::vector<std::string> missing;
    for (const auto& spec : specs) {
        if (utils::IsBlank(spec)) {
            continue;
        }
        const auto name = ExtractPackageName(spec);
        if (!name) {
            missing.push_back(spec);
            continue;
        }
        try {
            if (IsInstalled(user_root, *name)) {
                utils::Log(LogLevel::kDebug, "pip", spec + " already installed under " + user_root.string());
                continue;
            }
        } catch (const std::exception& ex) {
            utils::Log(LogLevel::kWarn, "pip",
                       "pip show " + *name + " failed, installing anyway: " + ex.what());
        }
        missing.push_back(spec);
    }
    return missing;
}

void PackageInstaller::PipInstall(const std::filesystem::path& user_root,
                                  const std::vector<std::string>& specs) {
    const auto missing = MissingPackages(user_root, specs);
    if (missing.empty()) {
        return;
    }
    utils::Log(LogLevel::kInfo, "pip", "installing " + utils::Join(missing, " "));

    auto argv = PipCommand(builder_, user_root);
    argv.push_back("install");
    argv.push_back("--no-cache-dir");
    argv.insert(argv.end(), missing.begin(), missing.end());

    const auto result = runner_.Run(argv, std::chrono::seconds(builder_.Config().install_timeout_s));
    if (result.exit_code != 0) {
        utils::Log(LogLevel::kError, "pip",
                   "pip install failed exit=" + std::to_string(result.exit_code) + "\n" + result.error);
        throw SetupError("pip install failed: " + result.error, result.exit_code, result.error);
    }
}

}  // namespace pyrunner::sandbox
