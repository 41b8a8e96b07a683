#include "worker/worker_process.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rtmp2rtsp::worker {

using model::ErrorCode;
using model::Status;

namespace {

constexpr int kReadPollMs = 200;
constexpr size_t kMaxPartialLine = 1024;
constexpr auto kReapInterval = std::chrono::milliseconds(10);

int64_t SteadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool LooksLikeError(const std::string& line) {
    std::string lower(line.size(), '\0');
    std::transform(line.begin(), line.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("error") != std::string::npos || lower.find("fatal") != std::string::npos;
}

} // namespace

WorkerProcess::WorkerProcess(std::string name, WorkerCommand command, size_t log_capacity)
    : name_(std::move(name)), command_(std::move(command)), log_(log_capacity) {}

WorkerProcess::~WorkerProcess() {
    if (Poll()) {
        spdlog::warn("[{}] Worker pid={} still alive at teardown, killing", name_, pid_);
        Kill();
        while (Poll()) std::this_thread::sleep_for(kReapInterval);
    }
    JoinReader();
}

Status WorkerProcess::Launch() {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (pid_ > 0) {
        return Status::Error(ErrorCode::ALREADY_RUNNING, "worker already launched");
    }

    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Status::Error(ErrorCode::WORKER_START_FAILED, std::string("pipe: ") + std::strerror(errno));
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        std::string err = std::strerror(errno);
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        return Status::Error(ErrorCode::WORKER_START_FAILED, "pipe: " + err);
    }
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(command_.binary);
    argv_storage.insert(argv_storage.end(), command_.args.begin(), command_.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    fsm_.TransitionTo(State::STARTING);
    pid_t pid = ::fork();
    if (pid < 0) {
        std::string err = std::strerror(errno);
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        CloseFd(exec_pipe[0]);
        CloseFd(exec_pipe[1]);
        CloseFd(devnull);
        fsm_.TransitionTo(State::STOPPED);
        return Status::Error(ErrorCode::WORKER_START_FAILED, "fork: " + err);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);

        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also done by the child; whichever runs first wins.
    ::setpgid(pid, pid);
    CloseFd(out_pipe[1]);
    CloseFd(exec_pipe[1]);
    CloseFd(devnull);

    // EOF on the exec pipe means execvp succeeded and O_CLOEXEC closed it.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    pid_ = pid;
    started_at_ = std::chrono::steady_clock::now();
    last_output_ms_ = 0;

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        reaped_ = true;
        wait_status_ = status;
        CloseFd(out_pipe[0]);
        fsm_.TransitionTo(State::EXITED);
        return Status::Error(ErrorCode::WORKER_START_FAILED,
            "exec " + command_.binary + ": " + std::strerror(child_errno));
    }

    out_fd_ = out_pipe[0];
    reader_ = std::thread(&WorkerProcess::ReadLoop, this);
    spdlog::info("[{}] Worker started, pid={}", name_, pid_);
    return Status::Ok();
}

bool WorkerProcess::Poll() {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (pid_ <= 0 || reaped_) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r < 0 && errno == EINTR) return true;

    reaped_ = true;
    // ECHILD: somebody else reaped the child and the status is lost.
    wait_status_ = (r == pid_) ? status : -1;
    fsm_.TransitionTo(State::EXITED);
    return false;
}

bool WorkerProcess::Terminate(std::chrono::milliseconds grace) {
    if (!Poll()) return false;

    fsm_.TransitionTo(State::STOPPING);
    Signal(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!Poll()) return false;
        std::this_thread::sleep_for(kReapInterval);
    }
    if (!Poll()) return false;

    Signal(SIGKILL);
    while (Poll()) {
        std::this_thread::sleep_for(kReapInterval);
    }
    return true;
}

void WorkerProcess::Kill() {
    Signal(SIGKILL);
}

void WorkerProcess::Signal(int sig) {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (pid_ <= 0 || reaped_) return;
    if (::kill(-pid_, sig) != 0 && ::kill(pid_, sig) != 0 && errno != ESRCH) {
        spdlog::warn("[{}] kill(pid={}, sig={}) failed: {}", name_, pid_, sig, std::strerror(errno));
    }
}

void WorkerProcess::JoinReader() {
    stop_reading_ = true;
    if (reader_.joinable()) reader_.join();
    CloseFd(out_fd_);
}

void WorkerProcess::ReadLoop() {
    char buf[4096];
    while (true) {
        pollfd pfd{out_fd_, POLLIN, 0};
        int r = ::poll(&pfd, 1, kReadPollMs);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) {
            // Keep draining while data flows; only give up once idle.
            if (stop_reading_) break;
            continue;
        }

        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            log_.Append(buf, static_cast<size_t>(n));
            last_output_ms_ = SteadyNowMs();
            ScanLines(buf, static_cast<size_t>(n));
            fsm_.TransitionFrom(State::STARTING, State::RUNNING);
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR || errno == EAGAIN) continue;
        break;
    }
}

void WorkerProcess::ScanLines(const char* data, size_t len) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];
        if (c == '\n' || c == '\r') {
            if (!partial_line_.empty() && LooksLikeError(partial_line_)) {
                last_error_line_ = partial_line_;
                spdlog::debug("[{}] Worker reported: {}", name_, last_error_line_);
            }
            partial_line_.clear();
        } else if (partial_line_.size() < kMaxPartialLine) {
            partial_line_.push_back(c);
        }
    }
}

std::optional<int> WorkerProcess::GetExitCode() const {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (!reaped_) return std::nullopt;
    if (wait_status_ == -1) return -1;
    if (WIFEXITED(wait_status_)) return WEXITSTATUS(wait_status_);
    if (WIFSIGNALED(wait_status_)) return 128 + WTERMSIG(wait_status_);
    return -1;
}

std::string WorkerProcess::DescribeExit() const {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (!reaped_) return "running";
    if (wait_status_ == -1) return "exited, status unavailable";
    if (WIFEXITED(wait_status_)) return "exited with code " + std::to_string(WEXITSTATUS(wait_status_));
    if (WIFSIGNALED(wait_status_)) return "killed by signal " + std::to_string(WTERMSIG(wait_status_));
    return "exited";
}

int64_t WorkerProcess::GetLastOutputAgeMs() const {
    int64_t last = last_output_ms_.load();
    if (last == 0) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_).count();
    }
    return SteadyNowMs() - last;
}

std::string WorkerProcess::GetLastErrorLine() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_line_;
}

void WorkerProcess::ClearError() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_line_.clear();
}

} // namespace rtmp2rtsp::worker
