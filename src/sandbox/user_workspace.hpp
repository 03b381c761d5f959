#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pyrunner::sandbox {

// First 6 bytes of SHA-256(user_id), lowercase hex.
std::string UserHash(const std::string& user_id);

// Conversation ids become directory names: [A-Za-z0-9_-] kept, anything else
// mapped to '_', empty -> "default".
std::string SanitizeConversationId(const std::string& conversation_id);

// {workspace_root}/user-{hash}, mounted as /ws. Nothing here ever deletes it.
class UserWorkspace {
public:
    UserWorkspace(const std::filesystem::path& workspace_root, const std::string& user_id);

    const std::filesystem::path& Root() const { return root_; }

    void EnsureRoot() const;
    std::filesystem::path ConversationDir(const std::string& conversation_id) const;

    // relative_path must stay inside dir; returns false when it does not or
    // the write fails.
    static bool WriteFile(const std::filesystem::path& dir,
                          const std::string& relative_path,
                          const std::string& content);
    static std::optional<std::string> ReadFile(const std::filesystem::path& dir,
                                               const std::string& relative_path);

private:
    std::filesystem::path root_;
};

}  // namespace pyrunner::sandbox
