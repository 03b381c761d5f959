#include "agent/tools/python_exec.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "sandbox/user_workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyrunner::agent::tools {
namespace {

using utils::LogLevel;

constexpr std::size_t kStderrPreviewChars = 512;

std::string GetParam(const std::unordered_map<std::string, std::string>& params,
                     const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

// Empty or missing -> empty json array; anything but an array -> nullopt.
std::optional<nlohmann::json> ParseArrayParam(const std::unordered_map<std::string, std::string>& params,
                                              const std::string& name) {
    const auto raw = GetParam(params, name);
    if (utils::IsBlank(raw)) {
        return nlohmann::json::array();
    }
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return std::nullopt;
    }
    return parsed;
}

std::vector<std::string> StringItems(const nlohmann::json& array) {
    std::vector<std::string> items;
    for (const auto& item : array) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        } else if (!item.is_null()) {
            items.push_back(item.dump());
        }
    }
    return items;
}

bool Truncate(std::string& text, long max_bytes) {
    const auto limit = static_cast<std::size_t>(max_bytes);
    if (text.size() <= limit) {
        return false;
    }
    text.resize(limit);
    return true;
}

}  // namespace

PythonExecTool::PythonExecTool(config::Config config,
                               sandbox::CommandRunner& runner,
                               sandbox::EnvSnapshot env)
    : config_(std::move(config)),
      builder_(config_.runner, std::move(env)),
      venv_(builder_, runner),
      installer_(builder_, runner),
      executor_(builder_, runner) {}

void PythonExecTool::SetContext(const std::string& user_id, const std::string& conversation_id) {
    default_user_id_ = user_id;
    default_conversation_id_ = conversation_id;
}

std::string PythonExecTool::ParametersJson() const {
    return R"({"type":"object","properties":{)"
           R"("code":{"type":"string","description":"Python 3 code to run. Print results to stdout."},)"
           R"("user_id":{"type":"string"},)"
           R"("conversation_id":{"type":"string"},)"
           R"("timeout_ms":{"type":"integer","minimum":1,"default":15000},)"
           R"("files":{"type":"array","items":{"type":"object","properties":{"path":{"type":"string","description":"Relative path like data/in.txt"},"content":{"type":"string"}},"required":["path"]},"description":"Auxiliary text files to create before running."},)"
           R"("return_files":{"type":"array","items":{"type":"string"},"description":"Relative file paths to read back after execution."},)"
           R"("pip":{"type":"array","items":{"type":"string"},"description":"Packages to pip install (ignored unless allowPip is on)."})"
           R"(},"required":["code"]})";
}

std::chrono::milliseconds PythonExecTool::ClampTimeout(const std::string& requested) const {
    const long max_ms = config_.tool.max_timeout_ms;
    const long fallback = std::min<long>(config_.tool.default_timeout_ms, max_ms);
    long value = 0;
    try {
        std::size_t consumed = 0;
        const auto trimmed = utils::Trim(requested);
        value = std::stol(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            value = 0;
        }
    } catch (const std::exception&) {
        value = 0;
    }
    if (value <= 0) {
        return std::chrono::milliseconds(fallback > 0 ? fallback : max_ms);
    }
    return std::chrono::milliseconds(std::min(value, max_ms));
}

std::string PythonExecTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    if (!config_.tool.enabled) {
        utils::Log(LogLevel::kError, "python", "python_exec is disabled by config");
        return "Error: python_exec is disabled by config";
    }
    const auto code = GetParam(params, "code");
    if (utils::IsBlank(code)) {
        return "Error: code is required";
    }
    auto user_id = GetParam(params, "user_id");
    if (user_id.empty()) {
        user_id = default_user_id_;
    }
    if (user_id.empty()) {
        return "Error: user_id is required";
    }
    auto conversation_id = GetParam(params, "conversation_id");
    if (conversation_id.empty()) {
        conversation_id = default_conversation_id_;
    }

    const auto files = ParseArrayParam(params, "files");
    const auto pip = ParseArrayParam(params, "pip");
    const auto return_files = ParseArrayParam(params, "return_files");
    if (!files || !pip || !return_files) {
        return "Error: files, pip and return_files must be JSON arrays";
    }
    const auto timeout = ClampTimeout(GetParam(params, "timeout_ms"));
    const auto started = std::chrono::steady_clock::now();

    sandbox::UserWorkspace workspace(config_.runner.workspace_root, user_id);
    std::filesystem::path conversation_dir;
    try {
        workspace.EnsureRoot();
        conversation_dir = workspace.ConversationDir(conversation_id);
    } catch (const std::filesystem::filesystem_error& ex) {
        utils::Log(LogLevel::kError, "python", std::string("workspace unavailable: ") + ex.what());
        return std::string("Error: workspace unavailable: ") + ex.what();
    }

    if (!sandbox::UserWorkspace::WriteFile(conversation_dir, sandbox::kEntryScript, code)) {
        return "Error: failed to write main.py";
    }
    for (const auto& file : *files) {
        if (!file.is_object() || !file.contains("path") || !file["path"].is_string()) {
            continue;
        }
        const auto path = file["path"].get<std::string>();
        if (utils::IsBlank(path)) {
            continue;
        }
        const auto content = file.contains("content") && file["content"].is_string()
            ? file["content"].get<std::string>()
            : std::string();
        if (!sandbox::UserWorkspace::WriteFile(conversation_dir, path, content)) {
            return "Error: failed to write file " + path;
        }
    }

    try {
        venv_.EnsureVenv(workspace.Root());
        const auto packages = StringItems(*pip);
        if (!packages.empty()) {
            if (config_.tool.allow_pip) {
                installer_.PipInstall(workspace.Root(), packages);
            } else {
                utils::Log(LogLevel::kWarn, "python",
                           "pip requested but allowPip is off, ignoring: " + utils::Join(packages, " "));
            }
        }
    } catch (const sandbox::SetupError& ex) {
        return std::string("Error: ") + ex.what();
    }

    auto result = executor_.ExecPython(workspace.Root(), conversation_dir, timeout);
    const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    const bool stdout_truncated = Truncate(result.output, config_.tool.max_output_bytes);
    const bool stderr_truncated = Truncate(result.error, config_.tool.max_output_bytes);

    if (result.exit_code == sandbox::kTimeoutExitCode) {
        std::string message = "Error: python timed out after " + std::to_string(timeout.count()) + " ms";
        if (!result.output.empty()) {
            message += "\n[stdout]\n" + result.output;
        }
        return message;
    }
    if (result.exit_code != 0) {
        std::string message = "Error: python exit " + std::to_string(result.exit_code);
        if (!utils::IsBlank(result.error)) {
            message += "; stderr=" + utils::Abbreviate(result.error, kStderrPreviewChars);
        }
        return message;
    }

    nlohmann::json payload = {
        {"exitCode", result.exit_code},
        {"stdout", result.output},
        {"stderr", result.error},
        {"durationMs", duration_ms},
        {"truncated", {{"stdout", stdout_truncated}, {"stderr", stderr_truncated}}}
    };
    nlohmann::json read_back = nlohmann::json::object();
    for (const auto& path : StringItems(*return_files)) {
        const auto content = sandbox::UserWorkspace::ReadFile(conversation_dir, path);
        if (content) {
            read_back[path] = *content;
        } else {
            utils::Log(LogLevel::kDebug, "python", "return file not found: " + path);
        }
    }
    if (!read_back.empty()) {
        payload["files"] = read_back;
    }
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace pyrunner::agent::tools
