#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "model/status.hpp"
#include "model/stream.hpp"
#include "store/stream_store.hpp"
#include "utils/keyed_mutex.hpp"
#include "worker/process_controller.hpp"

namespace rtmp2rtsp::service {

// Restart-on-crash is opt-in. Disabled, an exited worker stays visible as
// not running until someone removes or replaces the stream.
struct RestartPolicy {
    bool enabled = false;
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    // Running this long after a restart clears the attempt counter.
    std::chrono::milliseconds stable_after{30000};
};

struct SupervisorOptions {
    std::chrono::milliseconds reconcile_interval{5000};
    std::chrono::milliseconds shutdown_deadline{10000};
    bool autostart_on_load = false;
    RestartPolicy restart;
};

class StreamSupervisor {
public:
    StreamSupervisor(std::shared_ptr<store::StreamStore> store,
                     std::shared_ptr<worker::ProcessController> controller,
                     SupervisorOptions options);
    ~StreamSupervisor();

    StreamSupervisor(const StreamSupervisor&) = delete;
    StreamSupervisor& operator=(const StreamSupervisor&) = delete;

    // All-or-nothing: a failed worker start leaves no record behind.
    model::Status AddStream(const model::StreamConfig& config);
    // Succeeds once the record is gone, even if the worker had to be killed.
    model::Status RemoveStream(const std::string& name);
    // Swaps the config of an existing stream and restarts its worker. On a
    // failed start the previous config is restored.
    model::Status ReplaceStream(const model::StreamConfig& config);

    std::vector<model::StreamRecord> ListStreams() const;
    std::optional<model::StreamRecord> GetStream(const std::string& name) const;
    // nullopt when the stream is not registered; empty when nothing captured.
    std::optional<std::string> GetStreamLogs(const std::string& name, size_t max_bytes) const;

    model::Status ClearStreamError(const std::string& name);
    void ClearAllErrors();

    // Re-registers persisted streams after a restart. Workers are only
    // started when autostart_on_load is set. Returns the number started.
    size_t Recover();

    void StartReconciler();
    // One synchronous pass over every registered stream.
    void ReconcileOnce();

    // Stops the reconciler and every worker within shutdown_deadline.
    void Shutdown();

    size_t ActiveWorkerCount() const;
    const SupervisorOptions& options() const { return options_; }

private:
    struct RestartState {
        int attempts = 0;
        std::chrono::steady_clock::time_point last_attempt{};
    };

    void ReconcileLoop();
    void ReconcileStream(const std::string& name);
    // Caller holds the per-name lock.
    void ReconcileLocked(const std::string& name);
    void MaybeRestart(const model::StreamRecord& record, model::StreamStatus& status);
    // True when an earlier restart attempt left no worker behind.
    bool RestartPending(const std::string& name);
    void NoteAlive(const std::string& name);
    void ForgetRestarts(const std::string& name);
    std::chrono::milliseconds CalculateBackoff(int attempts) const;
    void UpdateStreamGauge();

    std::shared_ptr<store::StreamStore> store_;
    std::shared_ptr<worker::ProcessController> controller_;
    SupervisorOptions options_;

    utils::KeyedMutex name_locks_;

    std::mutex restart_mutex_;
    std::unordered_map<std::string, RestartState> restarts_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_ = false;
    std::thread reconciler_;
    std::atomic<bool> shut_down_{false};
};

} // namespace rtmp2rtsp::service
