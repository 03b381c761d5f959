#include "sandbox/process_executor.hpp"

#include <boost/process.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <sys/wait.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyrunner::sandbox {
namespace bp = boost::process;
namespace {

using utils::LogLevel;

constexpr auto kPollInterval = std::chrono::milliseconds(5);
constexpr auto kTimeoutJoinGrace = std::chrono::milliseconds(200);
constexpr auto kExitJoinGrace = std::chrono::seconds(2);

// Shared with the reader threads, which may outlive Run() when a grandchild
// keeps a pipe open after the child itself is gone.
struct StreamCapture {
    bp::pipe out_pipe;
    bp::pipe err_pipe;
    std::mutex mutex;
    std::condition_variable done_cv;
    std::string output;
    std::string error;
    int readers_done = 0;

    std::string Output() {
        std::lock_guard<std::mutex> lock(mutex);
        return output;
    }

    std::string Error() {
        std::lock_guard<std::mutex> lock(mutex);
        return error;
    }
};

void DrainPipe(std::shared_ptr<StreamCapture> capture,
               bp::pipe StreamCapture::*source,
               std::string StreamCapture::*target) {
    char buffer[4096];
    try {
        auto& pipe = (*capture).*source;
        while (true) {
            const auto count = pipe.read(buffer, static_cast<int>(sizeof(buffer)));
            if (count <= 0) {
                break;
            }
            std::lock_guard<std::mutex> lock(capture->mutex);
            ((*capture).*target).append(buffer, static_cast<std::size_t>(count));
        }
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kDebug, "exec", std::string("reader stopped: ") + ex.what());
    }
    {
        std::lock_guard<std::mutex> lock(capture->mutex);
        ++capture->readers_done;
    }
    capture->done_cv.notify_all();
}

class ReaderThreads {
public:
    ReaderThreads() = default;
    ReaderThreads(const ReaderThreads&) = delete;
    ReaderThreads& operator=(const ReaderThreads&) = delete;

    ~ReaderThreads() {
        Release();
    }

    void Start(const std::shared_ptr<StreamCapture>& capture) {
        out_ = std::thread(DrainPipe, capture, &StreamCapture::out_pipe, &StreamCapture::output);
        err_ = std::thread(DrainPipe, capture, &StreamCapture::err_pipe, &StreamCapture::error);
    }

    // Joins both readers if they reach EOF within grace, otherwise leaves them
    // running detached; the buffers stay valid through the shared capture.
    void Finish(StreamCapture& capture, std::chrono::milliseconds grace) {
        if (!out_.joinable() && !err_.joinable()) {
            return;
        }
        bool drained = false;
        {
            std::unique_lock<std::mutex> lock(capture.mutex);
            drained = capture.done_cv.wait_for(lock, grace, [&capture] {
                return capture.readers_done >= 2;
            });
        }
        if (drained) {
            out_.join();
            err_.join();
            return;
        }
        utils::Log(LogLevel::kDebug, "exec", "readers still blocked, detaching");
        Release();
    }

private:
    void Release() {
        if (out_.joinable()) {
            out_.detach();
        }
        if (err_.joinable()) {
            err_.detach();
        }
    }

    std::thread out_;
    std::thread err_;
};

// Kills and reaps the child on every path out of Run().
class ChildReaper {
public:
    explicit ChildReaper(bp::child& child) : child_(child) {}
    ChildReaper(const ChildReaper&) = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    ~ChildReaper() {
        std::error_code ec;
        if (child_.valid() && child_.running(ec)) {
            child_.terminate(ec);
        }
    }

private:
    bp::child& child_;
};

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    return bp::search_path(name).string();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

}  // namespace

ExecResult ProcessExecutor::Run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return ExecResult{kLaunchFailureExitCode, {}, "empty command"};
    }
    utils::Log(LogLevel::kDebug, "exec", "$ " + utils::Join(argv, " "));

    std::shared_ptr<StreamCapture> capture;
    ReaderThreads readers;
    try {
        capture = std::make_shared<StreamCapture>();
        const auto executable = ResolveExecutable(argv.front());
        if (executable.empty()) {
            return ExecResult{kLaunchFailureExitCode, {}, "executable not found: " + argv.front()};
        }
        const std::vector<std::string> args(argv.begin() + 1, argv.end());

        bp::child child(
            bp::exe = executable,
            bp::args = args,
            bp::std_in.close(),
            bp::std_out > capture->out_pipe,
            bp::std_err > capture->err_pipe);
        ChildReaper reaper(child);
        readers.Start(capture);

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = !child.running();
        while (!finished && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kPollInterval);
            finished = !child.running();
        }

        if (!finished) {
            std::error_code ec;
            child.terminate(ec);
            if (ec) {
                utils::Log(LogLevel::kWarn, "exec", "kill failed: " + ec.message());
            }
            readers.Finish(*capture, kTimeoutJoinGrace);
            utils::Log(LogLevel::kWarn, "exec",
                       "killed " + argv.front() + " after " + std::to_string(timeout.count()) + " ms");
            return ExecResult{kTimeoutExitCode, capture->Output(), "timeout"};
        }

        readers.Finish(*capture, kExitJoinGrace);
        const auto exit_code = DecodeStatus(child.native_exit_code());
        utils::Log(LogLevel::kDebug, "exec", "exit code " + std::to_string(exit_code));
        return ExecResult{exit_code, capture->Output(), capture->Error()};
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kError, "exec", std::string("exec failed: ") + ex.what());
        std::string partial;
        if (capture) {
            readers.Finish(*capture, kTimeoutJoinGrace);
            partial = capture->Output();
        }
        return ExecResult{kLaunchFailureExitCode, partial, ex.what()};
    }
}

}  // namespace pyrunner::sandbox
