#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include "worker/process_controller.hpp"
#include "worker/worker_command.hpp"
#include "worker/worker_process.hpp"

namespace rtmp2rtsp::worker {

struct ControllerOptions {
    size_t log_buffer_bytes = 256 * 1024;
    std::chrono::milliseconds stop_grace{5000};
    // A live worker silent for this long is reported as stalled.
    std::chrono::milliseconds stall_timeout{30000};
    size_t reason_lines = 3;
};

class PosixProcessController : public ProcessController {
public:
    PosixProcessController(CommandBuilder builder, ControllerOptions options);
    ~PosixProcessController() override;

    model::Status Start(const std::string& name, const model::StreamConfig& config) override;
    model::Status Stop(const std::string& name) override;
    std::optional<ProbeResult> Probe(const std::string& name) override;
    std::optional<std::string> TailLog(const std::string& name, size_t max_bytes) override;
    model::Status ClearError(const std::string& name) override;
    void Forget(const std::string& name) override;
    std::vector<std::string> ActiveWorkers() const override;
    void StopAll(std::chrono::steady_clock::time_point deadline) override;

    // Test hook: pid of the worker registered for name, or -1.
    pid_t GetPid(const std::string& name) const;
    // Test hook: number of stopped names still remembered.
    size_t RememberedStopCount() const;

private:
    struct Entry {
        std::shared_ptr<WorkerProcess> proc;  // null while launching
        bool stopping = false;
        bool exit_reported = false;
        std::promise<void> stop_promise;
        std::shared_future<void> stop_done;
    };

    std::shared_ptr<Entry> Find(const std::string& name) const;
    std::string SummarizeExit(const WorkerProcess& proc) const;
    std::string DescribeHealth(const WorkerProcess& proc) const;

    CommandBuilder builder_;
    ControllerOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> workers_;
    // Names whose worker was released by Stop; a repeated Stop is a no-op.
    // Emptied by Forget when the stream is removed.
    std::unordered_set<std::string> stopped_;
};

} // namespace rtmp2rtsp::worker
