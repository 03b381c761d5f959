#include <gtest/gtest.h>

#include <fstream>

#include <nlohmann/json.hpp>

#include "agent/tools/python_exec.hpp"
#include "recording_runner.hpp"
#include "sandbox/user_workspace.hpp"

using namespace pyrunner::agent::tools;
using namespace pyrunner::sandbox;
using namespace pyrunner::testing;

namespace {

bool IsVenvCreate(const std::vector<std::string>& argv) {
    return Contains(argv, "venv");
}

bool IsScriptRun(const std::vector<std::string>& argv) {
    return Contains(argv, "main.py");
}

}  // namespace

class PythonExecToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = MakeTempDir("python_exec_test");
        config_.runner.workspace_root = base_.string();
        ScriptResult(ExecResult{0, "hello\n", ""});
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(base_, ec);
    }

    // Venv creation materialises the interpreter; every script run returns
    // `result`; pip probes report the package as absent.
    void ScriptResult(ExecResult result) {
        runner_.handler = [result](const std::vector<std::string>& argv) {
            if (IsVenvCreate(argv)) {
                const auto python = MountedRoot(argv) / ".venv" / "bin" / "python";
                std::filesystem::create_directories(python.parent_path());
                std::ofstream(python) << "";
                return ExecResult{0, {}, {}};
            }
            if (IsScriptRun(argv)) {
                return result;
            }
            if (Contains(argv, "show")) {
                return ExecResult{1, {}, {}};
            }
            return ExecResult{0, {}, {}};
        };
    }

    std::vector<RecordedCall> CallsWith(const std::string& token) const {
        std::vector<RecordedCall> matching;
        for (const auto& call : runner_.calls) {
            if (Contains(call.argv, token)) {
                matching.push_back(call);
            }
        }
        return matching;
    }

    std::filesystem::path ConversationDir(const std::string& user, const std::string& conversation) const {
        return base_ / ("user-" + UserHash(user)) / conversation;
    }

    std::filesystem::path base_;
    pyrunner::config::Config config_;
    RecordingRunner runner_;
};

TEST_F(PythonExecToolTest, SuccessfulRunReturnsJsonPayload) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    const auto output = tool.Execute({{"code", "print('hello')"}, {"user_id", "alice"}, {"conversation_id", "c1"}});

    const auto payload = nlohmann::json::parse(output);
    EXPECT_EQ(0, payload["exitCode"].get<int>());
    EXPECT_EQ("hello\n", payload["stdout"].get<std::string>());
    EXPECT_EQ("", payload["stderr"].get<std::string>());
    EXPECT_TRUE(payload.contains("durationMs"));
    EXPECT_FALSE(payload["truncated"]["stdout"].get<bool>());
    EXPECT_FALSE(payload["truncated"]["stderr"].get<bool>());
    EXPECT_FALSE(payload.contains("files"));

    const auto script = UserWorkspace::ReadFile(ConversationDir("alice", "c1"), "main.py");
    ASSERT_TRUE(script.has_value());
    EXPECT_EQ("print('hello')", *script);
}

TEST_F(PythonExecToolTest, VenvIsCreatedOnceAcrossCalls) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}});
    tool.Execute({{"code", "print(2)"}, {"user_id", "alice"}});

    EXPECT_EQ(1u, CallsWith("venv").size());
    EXPECT_EQ(2u, CallsWith("main.py").size());
}

TEST_F(PythonExecToolTest, ScriptRunsInConversationDirWithoutNetwork) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}, {"conversation_id", "chat 7"}});

    const auto runs = CallsWith("main.py");
    ASSERT_EQ(1u, runs.size());
    EXPECT_TRUE(HasPair(runs[0].argv, "-w", "/ws/chat_7"));
    EXPECT_TRUE(HasPair(runs[0].argv, "--network", "none"));
    EXPECT_EQ(std::chrono::milliseconds(15000), runs[0].timeout);
}

TEST_F(PythonExecToolTest, DisabledToolRefuses) {
    config_.tool.enabled = false;
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: python_exec is disabled by config",
              tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}}));
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(PythonExecToolTest, CodeIsRequired) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});
    EXPECT_EQ("Error: code is required", tool.Execute({{"user_id", "alice"}}));
    EXPECT_EQ("Error: code is required", tool.Execute({{"code", "  \n"}, {"user_id", "alice"}}));
}

TEST_F(PythonExecToolTest, UserIdFallsBackToContext) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});
    EXPECT_EQ("Error: user_id is required", tool.Execute({{"code", "print(1)"}}));

    tool.SetContext("bob", "session-9");
    const auto payload = nlohmann::json::parse(tool.Execute({{"code", "print(1)"}}));
    EXPECT_EQ(0, payload["exitCode"].get<int>());
    EXPECT_TRUE(std::filesystem::exists(ConversationDir("bob", "session-9") / "main.py"));
}

TEST_F(PythonExecToolTest, TimeoutReportsPartialStdout) {
    ScriptResult(ExecResult{kTimeoutExitCode, "partial", "timeout"});
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: python timed out after 15000 ms\n[stdout]\npartial",
              tool.Execute({{"code", "while True: pass"}, {"user_id", "alice"}}));
}

TEST_F(PythonExecToolTest, NonZeroExitReportsStderr) {
    ScriptResult(ExecResult{1, "", "Traceback (most recent call last):\nZeroDivisionError"});
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: python exit 1; stderr=Traceback (most recent call last):\nZeroDivisionError",
              tool.Execute({{"code", "1/0"}, {"user_id", "alice"}}));
}

TEST_F(PythonExecToolTest, LongStderrIsAbbreviated) {
    ScriptResult(ExecResult{2, "", std::string(2000, 'e')});
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    const auto output = tool.Execute({{"code", "raise SystemExit(2)"}, {"user_id", "alice"}});
    EXPECT_EQ("Error: python exit 2; stderr=" + std::string(512, 'e') + "...", output);
}

TEST_F(PythonExecToolTest, OutputIsTruncatedToLimit) {
    config_.tool.max_output_bytes = 4;
    ScriptResult(ExecResult{0, "hello\n", "warn"});
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    const auto payload = nlohmann::json::parse(tool.Execute({{"code", "print('hello')"}, {"user_id", "alice"}}));
    EXPECT_EQ("hell", payload["stdout"].get<std::string>());
    EXPECT_TRUE(payload["truncated"]["stdout"].get<bool>());
    EXPECT_EQ("warn", payload["stderr"].get<std::string>());
    EXPECT_FALSE(payload["truncated"]["stderr"].get<bool>());
}

TEST_F(PythonExecToolTest, ClampTimeoutHonoursDefaultAndMaximum) {
    config_.tool.default_timeout_ms = 15000;
    config_.tool.max_timeout_ms = 60000;
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout(""));
    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout("soon"));
    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout("-5"));
    EXPECT_EQ(std::chrono::milliseconds(500), tool.ClampTimeout("500"));
    EXPECT_EQ(std::chrono::milliseconds(30000), tool.ClampTimeout("30000"));
    EXPECT_EQ(std::chrono::milliseconds(60000), tool.ClampTimeout("600000"));
}

TEST_F(PythonExecToolTest, ClampTimeoutRejectsTrailingGarbage) {
    config_.tool.default_timeout_ms = 15000;
    config_.tool.max_timeout_ms = 60000;
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout("30000abc"));
    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout("1e3"));
    EXPECT_EQ(std::chrono::milliseconds(15000), tool.ClampTimeout("2.5"));
    EXPECT_EQ(std::chrono::milliseconds(30000), tool.ClampTimeout(" 30000 "));
}

TEST_F(PythonExecToolTest, RequestedTimeoutReachesRunner) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}, {"timeout_ms", "2000"}});

    const auto runs = CallsWith("main.py");
    ASSERT_EQ(1u, runs.size());
    EXPECT_EQ(std::chrono::milliseconds(2000), runs[0].timeout);
}

TEST_F(PythonExecToolTest, PipIgnoredUnlessAllowed) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}, {"pip", R"(["numpy"])"}});

    EXPECT_TRUE(CallsWith("pip").empty());
    EXPECT_EQ(1u, CallsWith("main.py").size());
}

TEST_F(PythonExecToolTest, PipInstalledWhenAllowed) {
    config_.tool.allow_pip = true;
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    tool.Execute({{"code", "import numpy"}, {"user_id", "alice"}, {"pip", R"(["numpy==1.26"])"}});

    const auto installs = CallsWith("install");
    ASSERT_EQ(1u, installs.size());
    EXPECT_EQ("numpy==1.26", installs[0].argv.back());
    EXPECT_FALSE(Contains(installs[0].argv, "--network"));
}

TEST_F(PythonExecToolTest, SetupFailureIsReported) {
    runner_.handler = [](const std::vector<std::string>&) {
        return ExecResult{125, {}, "Unable to find image"};
    };
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: create venv failed: Unable to find image",
              tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}}));
    EXPECT_TRUE(CallsWith("main.py").empty());
}

TEST_F(PythonExecToolTest, AuxiliaryFilesWrittenAndReturned) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    const auto output = tool.Execute({
        {"code", "print(open('data/in.txt').read())"},
        {"user_id", "alice"},
        {"conversation_id", "c2"},
        {"files", R"([{"path":"data/in.txt","content":"1,2,3"},{"path":"empty.txt"}])"},
        {"return_files", R"(["data/in.txt","missing.txt"])"}
    });

    const auto payload = nlohmann::json::parse(output);
    ASSERT_TRUE(payload.contains("files"));
    EXPECT_EQ("1,2,3", payload["files"]["data/in.txt"].get<std::string>());
    EXPECT_FALSE(payload["files"].contains("missing.txt"));
    EXPECT_TRUE(std::filesystem::is_regular_file(ConversationDir("alice", "c2") / "empty.txt"));
}

TEST_F(PythonExecToolTest, EscapingFilePathIsRejected) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: failed to write file ../evil.py",
              tool.Execute({{"code", "print(1)"}, {"user_id", "alice"},
                            {"files", R"([{"path":"../evil.py","content":"x"}])"}}));
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(PythonExecToolTest, NonArrayListParameterIsRejected) {
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: files, pip and return_files must be JSON arrays",
              tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}, {"pip", "numpy"}}));
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(PythonExecToolTest, ReturnFileSymlinkPlantedByPreviousRunIsNotRead) {
    const auto secret = base_ / "host_secret.txt";
    std::ofstream(secret) << "HOST-SECRET";
    const auto dir = ConversationDir("alice", "c3");
    std::filesystem::create_directories(dir);
    std::filesystem::create_symlink(secret, dir / "out.txt");
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    const auto output = tool.Execute({
        {"code", "print(1)"},
        {"user_id", "alice"},
        {"conversation_id", "c3"},
        {"return_files", R"(["out.txt"])"}
    });

    const auto payload = nlohmann::json::parse(output);
    EXPECT_FALSE(payload.contains("files"));
    EXPECT_EQ(std::string::npos, output.find("HOST-SECRET"));
}

TEST_F(PythonExecToolTest, SymlinkedMainPyIsNotWrittenThrough) {
    const auto target = base_ / "host_file.py";
    std::ofstream(target) << "original";
    const auto dir = ConversationDir("alice", "c4");
    std::filesystem::create_directories(dir);
    std::filesystem::create_symlink(target, dir / "main.py");
    PythonExecTool tool(config_, runner_, EnvSnapshot{});

    EXPECT_EQ("Error: failed to write main.py",
              tool.Execute({{"code", "print(1)"}, {"user_id", "alice"}, {"conversation_id", "c4"}}));
    std::ifstream input(target);
    std::string content;
    std::getline(input, content);
    EXPECT_EQ("original", content);
}
