#include "sandbox/execution_runner.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

#include "utils/logging.hpp"

namespace pyrunner::sandbox {
namespace {

constexpr std::size_t kContainerNameBytes = 8;

// "pyrunner-<16 hex>", or empty when no randomness is available.
std::string NewContainerName() {
    unsigned char bytes[kContainerNameBytes];
    if (RAND_bytes(bytes, static_cast<int>(sizeof(bytes))) != 1) {
        utils::Log(utils::LogLevel::kWarn, "python", "RAND_bytes failed, running unnamed container");
        return {};
    }
    std::ostringstream oss;
    oss << "pyrunner-" << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

}  // namespace

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    const auto relative = NormalizeDir(candidate).lexically_relative(NormalizeDir(root));
    if (relative.empty()) {
        return false;
    }
    return *relative.begin() != "..";
}

ExecutionRunner::ExecutionRunner(const CommandBuilder& builder, CommandRunner& runner)
    : builder_(builder),
      runner_(runner) {}

ExecResult ExecutionRunner::ExecPython(const std::filesystem::path& user_root,
                                       const std::filesystem::path& conversation_dir,
                                       std::chrono::milliseconds timeout) {
    if (!IsWithin(user_root, conversation_dir)) {
        throw std::invalid_argument(
            "conversation dir " + conversation_dir.string() + " is outside " + user_root.string());
    }

    const auto container_name = NewContainerName();
    auto argv = builder_.Build(user_root, ExecutePhase{conversation_dir, container_name});
    argv.insert(argv.end(), {kContainerPython, "-X", "utf8", "-u", "-B", kEntryScript});

    const auto started = std::chrono::steady_clock::now();
    auto result = runner_.Run(argv, timeout);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::Log(utils::LogLevel::kInfo, "python",
               "exit=" + std::to_string(result.exit_code) +
               " duration_ms=" + std::to_string(elapsed.count()) +
               " stdout=" + std::to_string(result.output.size()) +
               " stderr=" + std::to_string(result.error.size()));
    if (result.exit_code == kTimeoutExitCode && !container_name.empty()) {
        RemoveContainer(container_name);
    }
    return result;
}

void ExecutionRunner::RemoveContainer(const std::string& container_name) {
    // Killing the client does not stop the container it started.
    const std::vector<std::string> argv = {builder_.Config().container_cli, "rm", "-f", container_name};
    const auto result = runner_.Run(argv, std::chrono::seconds(builder_.Config().probe_timeout_s));
    if (result.exit_code != 0) {
        utils::Log(utils::LogLevel::kWarn, "python",
                   "rm -f " + container_name + " failed exit=" + std::to_string(result.exit_code) +
                   "\n" + result.error);
    }
}

}  // namespace pyrunner::sandbox
