#include "service/stream_supervisor.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace rtmp2rtsp::service {

using model::ErrorCode;
using model::Status;
using model::StreamStatus;

namespace {

StreamStatus MakeStatus(bool running, std::string reason) {
    StreamStatus s;
    s.running = running;
    s.reason = std::move(reason);
    s.last_checked_at = std::chrono::system_clock::now();
    return s;
}

void CountError(const Status& st) {
    switch (st.code) {
        case ErrorCode::INVALID_CONFIG: utils::Metrics::Instance().errors_total("invalid_config").Increment(); break;
        case ErrorCode::DUPLICATE_NAME: utils::Metrics::Instance().errors_total("duplicate_name").Increment(); break;
        case ErrorCode::STORAGE_ERROR: utils::Metrics::Instance().errors_total("storage").Increment(); break;
        default: break;
    }
}

} // namespace

StreamSupervisor::StreamSupervisor(std::shared_ptr<store::StreamStore> store,
                                   std::shared_ptr<worker::ProcessController> controller,
                                   SupervisorOptions options)
    : store_(std::move(store)), controller_(std::move(controller)), options_(options) {}

StreamSupervisor::~StreamSupervisor() {
    Shutdown();
}

Status StreamSupervisor::AddStream(const model::StreamConfig& config) {
    auto violation = model::ValidateStreamConfig(config);
    if (!violation.empty()) {
        auto st = Status::Error(ErrorCode::INVALID_CONFIG, violation);
        CountError(st);
        return st;
    }

    auto guard = name_locks_.Lock(config.name);

    auto st = store_->Put(config, MakeStatus(false, "starting"), false);
    if (!st) {
        spdlog::warn("[{}] Add rejected: {}", config.name, st.message);
        CountError(st);
        return st;
    }

    st = controller_->Start(config.name, config);
    if (!st) {
        spdlog::error("[{}] Worker start failed, rolling back: {}", config.name, st.message);
        auto rollback = store_->Delete(config.name);
        if (!rollback) {
            spdlog::error("[{}] Rollback of record failed: {}", config.name, rollback.message);
        }
        return st;
    }

    ForgetRestarts(config.name);
    UpdateStreamGauge();
    spdlog::info("[{}] Stream added: {} -> rtsp port {}", config.name,
                 utils::Logger::RedactUrl(config.source_url), config.rtsp_port);
    return Status::Ok();
}

Status StreamSupervisor::RemoveStream(const std::string& name) {
    auto guard = name_locks_.Lock(name);

    if (!store_->Get(name)) {
        return Status::Error(ErrorCode::NOT_FOUND, "stream '" + name + "' not found");
    }

    auto st = controller_->Stop(name);
    if (!st && st.code != ErrorCode::NOT_FOUND) {
        spdlog::warn("[{}] Worker stop reported: {}", name, st.message);
    }

    st = store_->Delete(name);
    if (!st) {
        spdlog::error("[{}] Worker stopped but record could not be deleted: {}", name, st.message);
        CountError(st);
        auto update = store_->UpdateStatus(name, MakeStatus(false, "stopped; removal failed: " + st.message));
        if (!update) {
            spdlog::error("[{}] Status update failed: {}", name, update.message);
        }
        return st;
    }

    controller_->Forget(name);
    ForgetRestarts(name);
    UpdateStreamGauge();
    spdlog::info("[{}] Stream removed", name);
    return Status::Ok();
}

Status StreamSupervisor::ReplaceStream(const model::StreamConfig& config) {
    auto violation = model::ValidateStreamConfig(config);
    if (!violation.empty()) {
        auto st = Status::Error(ErrorCode::INVALID_CONFIG, violation);
        CountError(st);
        return st;
    }

    auto guard = name_locks_.Lock(config.name);

    auto previous = store_->Get(config.name);
    if (!previous) {
        return Status::Error(ErrorCode::NOT_FOUND, "stream '" + config.name + "' not found");
    }

    auto st = controller_->Stop(config.name);
    if (!st && st.code != ErrorCode::NOT_FOUND) {
        spdlog::warn("[{}] Worker stop reported: {}", config.name, st.message);
    }

    st = store_->Put(config, MakeStatus(false, "starting"), true);
    if (!st) {
        CountError(st);
        spdlog::error("[{}] Replace not persisted: {}", config.name, st.message);
    } else {
        st = controller_->Start(config.name, config);
        if (st) {
            ForgetRestarts(config.name);
            spdlog::info("[{}] Stream replaced: {} -> rtsp port {}", config.name,
                         utils::Logger::RedactUrl(config.source_url), config.rtsp_port);
            return Status::Ok();
        }
        spdlog::error("[{}] Worker start failed, restoring previous config: {}", config.name, st.message);
    }

    // Put the previous config back and bring its worker up again.
    auto restore = store_->Put(previous->config, MakeStatus(false, "starting"), true);
    if (!restore) {
        spdlog::error("[{}] Restore of previous config failed: {}", config.name, restore.message);
        return st;
    }
    auto restart = controller_->Start(config.name, previous->config);
    if (!restart) {
        auto update = store_->UpdateStatus(config.name,
            MakeStatus(false, "worker start failed: " + restart.message));
        if (!update) {
            spdlog::error("[{}] Status update failed: {}", config.name, update.message);
        }
    }
    return st;
}

std::vector<model::StreamRecord> StreamSupervisor::ListStreams() const {
    return store_->List();
}

std::optional<model::StreamRecord> StreamSupervisor::GetStream(const std::string& name) const {
    return store_->Get(name);
}

std::optional<std::string> StreamSupervisor::GetStreamLogs(const std::string& name, size_t max_bytes) const {
    if (!store_->Get(name)) return std::nullopt;
    return controller_->TailLog(name, max_bytes).value_or(std::string());
}

Status StreamSupervisor::ClearStreamError(const std::string& name) {
    auto guard = name_locks_.Lock(name);
    if (!store_->Get(name)) {
        return Status::Error(ErrorCode::NOT_FOUND, "stream '" + name + "' not found");
    }

    auto st = controller_->ClearError(name);
    if (!st && st.code != ErrorCode::NOT_FOUND) {
        return st;
    }
    spdlog::info("[{}] Cleared error state", name);
    ReconcileLocked(name);
    return Status::Ok();
}

void StreamSupervisor::ClearAllErrors() {
    for (const auto& rec : store_->List()) {
        auto st = ClearStreamError(rec.config.name);
        if (!st && st.code != ErrorCode::NOT_FOUND) {
            spdlog::warn("[{}] Clear error failed: {}", rec.config.name, st.message);
        }
    }
}

size_t StreamSupervisor::Recover() {
    auto records = store_->List();
    size_t started = 0;

    for (const auto& rec : records) {
        const auto& name = rec.config.name;
        auto guard = name_locks_.Lock(name);

        StreamStatus status = MakeStatus(false, "not started");
        if (options_.autostart_on_load) {
            auto st = controller_->Start(name, rec.config);
            if (st) {
                status.reason = "starting";
                ++started;
            } else if (st.code == ErrorCode::ALREADY_RUNNING) {
                continue;
            } else {
                status.reason = "worker start failed: " + st.message;
            }
        }

        auto st = store_->UpdateStatus(name, status);
        if (!st && st.code != ErrorCode::NOT_FOUND) {
            spdlog::warn("[{}] Status update failed: {}", name, st.message);
        }
    }

    UpdateStreamGauge();
    spdlog::info("Recovered {} stream(s), {} worker(s) started", records.size(), started);
    return started;
}

void StreamSupervisor::StartReconciler() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (reconciler_.joinable() || shut_down_) return;
    stop_requested_ = false;
    reconciler_ = std::thread(&StreamSupervisor::ReconcileLoop, this);
}

void StreamSupervisor::ReconcileLoop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (!stop_requested_) {
        if (loop_cv_.wait_for(lock, options_.reconcile_interval, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            ReconcileOnce();
        } catch (const std::exception& e) {
            spdlog::error("Reconciliation pass failed: {}", e.what());
        }
        lock.lock();
    }
}

void StreamSupervisor::ReconcileOnce() {
    for (const auto& rec : store_->List()) {
        ReconcileStream(rec.config.name);
    }
    utils::Metrics::Instance().reconcile_passes_total().Increment();
}

void StreamSupervisor::ReconcileStream(const std::string& name) {
    auto guard = name_locks_.Lock(name);
    ReconcileLocked(name);
}

void StreamSupervisor::ReconcileLocked(const std::string& name) {
    // The stream may have been removed after the pass took its list.
    auto record = store_->Get(name);
    if (!record) return;

    StreamStatus status;
    auto probe = controller_->Probe(name);
    if (!probe) {
        // No worker registered: never started, or a start that failed.
        status = MakeStatus(false, record->status.reason.empty() ? "not started" : record->status.reason);
        // A failed restart leaves nothing to probe; keep retrying it.
        if (RestartPending(name)) {
            MaybeRestart(*record, status);
        }
    } else {
        status = MakeStatus(probe->alive, probe->reason);
        if (probe->alive) {
            NoteAlive(name);
        } else {
            MaybeRestart(*record, status);
        }
    }

    auto st = store_->UpdateStatus(name, status);
    if (!st && st.code != ErrorCode::NOT_FOUND) {
        spdlog::warn("[{}] Status update failed: {}", name, st.message);
    }
}

void StreamSupervisor::MaybeRestart(const model::StreamRecord& record, StreamStatus& status) {
    const auto& policy = options_.restart;
    if (!policy.enabled) return;

    const auto& name = record.config.name;
    auto now = std::chrono::steady_clock::now();
    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(restart_mutex_);
        auto& state = restarts_[name];
        if (state.attempts >= policy.max_attempts) {
            static const std::string kLimitSuffix = " (restart limit reached)";
            const auto& r = status.reason;
            if (r.size() < kLimitSuffix.size() ||
                r.compare(r.size() - kLimitSuffix.size(), kLimitSuffix.size(), kLimitSuffix) != 0) {
                status.reason += kLimitSuffix;
            }
            return;
        }
        if (state.attempts > 0 && now - state.last_attempt < CalculateBackoff(state.attempts)) {
            return;
        }
        attempts = ++state.attempts;
        state.last_attempt = now;
    }

    spdlog::warn("[{}] Restarting worker (attempt {}/{})", name, attempts, policy.max_attempts);
    utils::Metrics::Instance().worker_restarts_total().Increment();

    // Releases the exited worker and its log buffer.
    auto st = controller_->Stop(name);
    if (!st && st.code != ErrorCode::NOT_FOUND) {
        spdlog::warn("[{}] Worker stop reported: {}", name, st.message);
    }

    st = controller_->Start(name, record.config);
    if (st) {
        status.reason = "restarting (attempt " + std::to_string(attempts) + "/" +
                        std::to_string(policy.max_attempts) + ")";
    } else {
        status.reason = "restart failed: " + st.message;
    }
}

bool StreamSupervisor::RestartPending(const std::string& name) {
    if (!options_.restart.enabled) return false;
    std::lock_guard<std::mutex> lock(restart_mutex_);
    auto it = restarts_.find(name);
    return it != restarts_.end() && it->second.attempts > 0;
}

void StreamSupervisor::NoteAlive(const std::string& name) {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    auto it = restarts_.find(name);
    if (it == restarts_.end() || it->second.attempts == 0) return;

    auto now = std::chrono::steady_clock::now();
    if (now - it->second.last_attempt >= options_.restart.stable_after) {
        spdlog::debug("[{}] Resetting restart backoff after stable run", name);
        it->second.attempts = 0;
    }
}

void StreamSupervisor::ForgetRestarts(const std::string& name) {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    restarts_.erase(name);
}

std::chrono::milliseconds StreamSupervisor::CalculateBackoff(int attempts) const {
    const auto& policy = options_.restart;
    if (attempts <= 0) return policy.initial_backoff;

    // initial, 2x, 4x ... capped at max_backoff
    double factor = std::pow(2.0, attempts - 1);
    double backoff_ms = std::min(policy.initial_backoff.count() * factor,
                                 static_cast<double>(policy.max_backoff.count()));

    // +/- 10% jitter
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(0.9, 1.1);
    return std::chrono::milliseconds(static_cast<int64_t>(backoff_ms * dis(gen)));
}

void StreamSupervisor::Shutdown() {
    if (shut_down_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (reconciler_.joinable()) reconciler_.join();

    spdlog::info("Stopping all workers (deadline {}ms)", options_.shutdown_deadline.count());
    controller_->StopAll(std::chrono::steady_clock::now() + options_.shutdown_deadline);
}

size_t StreamSupervisor::ActiveWorkerCount() const {
    return controller_->ActiveWorkers().size();
}

void StreamSupervisor::UpdateStreamGauge() {
    utils::Metrics::Instance().streams_configured().Set(static_cast<double>(store_->List().size()));
}

} // namespace rtmp2rtsp::service
