#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <sys/types.h>
#include "model/status.hpp"
#include "worker/log_ring_buffer.hpp"
#include "worker/worker_command.hpp"
#include "worker/worker_fsm.hpp"

namespace rtmp2rtsp::worker {

// One forked worker. The child runs in its own process group with stdin on
// /dev/null and stdout+stderr on a pipe drained into a LogRingBuffer.
class WorkerProcess {
public:
    WorkerProcess(std::string name, WorkerCommand command, size_t log_capacity);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    // Returns once exec has succeeded or failed; never waits for output.
    model::Status Launch();

    // Non-blocking reap. True while the child is alive.
    bool Poll();

    // SIGTERM to the group, wait up to grace, then SIGKILL. Returns true when
    // the SIGKILL escalation was needed.
    bool Terminate(std::chrono::milliseconds grace);

    // SIGKILL to the group without waiting.
    void Kill();

    // Stops the capture thread and closes the pipe.
    void JoinReader();

    State GetState() const { return fsm_.GetCurrentState(); }
    std::optional<int> GetExitCode() const;
    // "exited with code 1", "killed by signal 9"
    std::string DescribeExit() const;

    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }
    const WorkerCommand& command() const { return command_; }
    const LogRingBuffer& log() const { return log_; }

    std::chrono::steady_clock::time_point started_at() const { return started_at_; }
    int64_t GetLastOutputAgeMs() const;

    std::string GetLastErrorLine() const;
    void ClearError();

private:
    void ReadLoop();
    void ScanLines(const char* data, size_t len);
    void Signal(int sig);

    std::string name_;
    WorkerCommand command_;
    LogRingBuffer log_;
    WorkerFSM fsm_;

    mutable std::mutex proc_mutex_;
    pid_t pid_ = -1;
    bool reaped_ = false;
    int wait_status_ = 0;

    int out_fd_ = -1;
    std::thread reader_;
    std::atomic<bool> stop_reading_{false};

    std::chrono::steady_clock::time_point started_at_;
    std::atomic<int64_t> last_output_ms_{0};

    mutable std::mutex error_mutex_;
    std::string partial_line_;
    std::string last_error_line_;
};

} // namespace rtmp2rtsp::worker
