#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "model/status.hpp"
#include "model/stream.hpp"

namespace rtmp2rtsp::worker {

struct ProbeResult {
    bool alive = false;
    std::optional<int> exit_code;
    std::string reason;
};

// Owns at most one external worker per stream name. The supervisor only ever
// refers to a worker by that name.
class ProcessController {
public:
    virtual ~ProcessController() = default;

    // ALREADY_RUNNING if a worker is registered for name, WORKER_START_FAILED
    // if it cannot be spawned. Does not wait for the worker to become healthy.
    virtual model::Status Start(const std::string& name, const model::StreamConfig& config) = 0;

    // SIGTERM, grace period, SIGKILL. Releases the worker and its log buffer.
    // Repeating a Stop (or racing one) is a no-op; NOT_FOUND only for names
    // this controller never ran.
    virtual model::Status Stop(const std::string& name) = 0;

    // Non-blocking. nullopt when no worker is registered for name.
    virtual std::optional<ProbeResult> Probe(const std::string& name) = 0;

    // Last max_bytes of captured output. nullopt when no worker is registered.
    virtual std::optional<std::string> TailLog(const std::string& name, size_t max_bytes) = 0;

    // Forgets the last error line captured for name.
    virtual model::Status ClearError(const std::string& name) = 0;

    // Drops what the controller remembers about a stopped name once the
    // stream is gone for good. A later Stop for it reports NOT_FOUND.
    virtual void Forget(const std::string& name) = 0;

    virtual std::vector<std::string> ActiveWorkers() const = 0;

    // Stops every worker in parallel. Whatever is still alive at deadline is
    // killed unconditionally.
    virtual void StopAll(std::chrono::steady_clock::time_point deadline) = 0;
};

} // namespace rtmp2rtsp::worker
