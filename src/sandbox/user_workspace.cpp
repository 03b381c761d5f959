#include "sandbox/user_workspace.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <openssl/sha.h>

#include "sandbox/execution_runner.hpp"
#include "utils/logging.hpp"

namespace pyrunner::sandbox {
namespace {

constexpr std::size_t kUserHashBytes = 6;

std::optional<std::filesystem::path> ResolveInside(const std::filesystem::path& dir,
                                                   const std::string& relative_path) {
    if (relative_path.empty()) {
        return std::nullopt;
    }
    const std::filesystem::path relative(relative_path);
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return std::nullopt;
    }
    const auto base = NormalizeDir(dir);
    const auto target = (base / relative).lexically_normal();
    if (!IsWithin(base, target) || NormalizeDir(target) == base) {
        return std::nullopt;
    }

    // The directory is writable from inside the container, so any component
    // may have been replaced by a symlink since the last run.
    std::error_code ec;
    auto current = base;
    for (const auto& part : target.lexically_relative(base)) {
        current /= part;
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(current, ec))) {
            return std::nullopt;
        }
    }
    const auto real_base = std::filesystem::canonical(base, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto real_target = std::filesystem::weakly_canonical(target, ec);
    if (ec || !IsWithin(real_base, real_target) || NormalizeDir(real_target) == real_base) {
        return std::nullopt;
    }
    return real_target;
}

}  // namespace

std::string UserHash(const std::string& user_id) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(user_id.data()), user_id.size(), hash);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < kUserHashBytes; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string SanitizeConversationId(const std::string& conversation_id) {
    std::string sanitized;
    sanitized.reserve(conversation_id.size());
    for (unsigned char c : conversation_id) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            sanitized.push_back(static_cast<char>(c));
        } else {
            sanitized.push_back('_');
        }
    }
    return sanitized.empty() ? "default" : sanitized;
}

UserWorkspace::UserWorkspace(const std::filesystem::path& workspace_root, const std::string& user_id)
    : root_(NormalizeDir(workspace_root) / ("user-" + UserHash(user_id))) {}

void UserWorkspace::EnsureRoot() const {
    std::filesystem::create_directories(root_);
}

std::filesystem::path UserWorkspace::ConversationDir(const std::string& conversation_id) const {
    const auto dir = root_ / SanitizeConversationId(conversation_id);
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(dir, ec))) {
        throw std::filesystem::filesystem_error(
            "conversation dir is a symlink", dir, std::make_error_code(std::errc::permission_denied));
    }
    std::filesystem::create_directories(dir);
    return dir;
}

bool UserWorkspace::WriteFile(const std::filesystem::path& dir,
                              const std::string& relative_path,
                              const std::string& content) {
    const auto target = ResolveInside(dir, relative_path);
    if (!target) {
        utils::Log(utils::LogLevel::kWarn, "workspace", "refusing path " + relative_path);
        return false;
    }
    std::error_code ec;
    std::filesystem::create_directories(target->parent_path(), ec);
    std::ofstream output(*target, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        utils::Log(utils::LogLevel::kError, "workspace", "cannot write " + target->string());
        return false;
    }
    output << content;
    return static_cast<bool>(output);
}

std::optional<std::string> UserWorkspace::ReadFile(const std::filesystem::path& dir,
                                                   const std::string& relative_path) {
    const auto target = ResolveInside(dir, relative_path);
    std::error_code ec;
    if (!target || !std::filesystem::is_regular_file(*target, ec)) {
        return std::nullopt;
    }
    std::ifstream input(*target, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

}  // namespace pyrunner::sandbox
