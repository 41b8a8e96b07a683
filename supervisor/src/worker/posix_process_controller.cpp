#include "worker/posix_process_controller.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>

namespace rtmp2rtsp::worker {

using model::ErrorCode;
using model::Status;

namespace {

std::string FormatDuration(std::chrono::milliseconds d) {
    if (d.count() % 1000 == 0) return std::to_string(d.count() / 1000) + "s";
    return std::to_string(d.count()) + "ms";
}

} // namespace

PosixProcessController::PosixProcessController(CommandBuilder builder, ControllerOptions options)
    : builder_(std::move(builder)), options_(options) {}

PosixProcessController::~PosixProcessController() {
    StopAll(std::chrono::steady_clock::now() + options_.stop_grace);
}

std::shared_ptr<PosixProcessController::Entry> PosixProcessController::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) return nullptr;
    return it->second;
}

Status PosixProcessController::Start(const std::string& name, const model::StreamConfig& config) {
    auto entry = std::make_shared<Entry>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workers_.count(name)) {
            return Status::Error(ErrorCode::ALREADY_RUNNING, "worker for '" + name + "' already exists");
        }
        workers_[name] = entry;
        stopped_.erase(name);
    }

    WorkerCommand command = builder_(config);
    spdlog::info("[{}] Launching worker: {}", name, command.ToString());

    auto proc = std::make_shared<WorkerProcess>(name, std::move(command), options_.log_buffer_bytes);
    auto st = proc->Launch();
    if (!st) {
        spdlog::error("[{}] Worker launch failed: {}", name, st.message);
        utils::Metrics::Instance().errors_total("start_failed").Increment();
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.erase(name);
        return st;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->proc = std::move(proc);
    }
    utils::Metrics::Instance().worker_starts_total().Increment();
    utils::Metrics::Instance().workers_active().Increment();
    return Status::Ok();
}

Status PosixProcessController::Stop(const std::string& name) {
    std::shared_ptr<Entry> entry;
    std::shared_ptr<WorkerProcess> proc;
    std::shared_future<void> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(name);
        if (it == workers_.end()) {
            if (stopped_.count(name)) return Status::Ok();
            return Status::Error(ErrorCode::NOT_FOUND, "no worker for '" + name + "'");
        }
        entry = it->second;
        if (entry->stopping) {
            in_flight = entry->stop_done;
        } else if (!entry->proc) {
            return Status::Error(ErrorCode::ALREADY_RUNNING, "worker for '" + name + "' is still launching");
        } else {
            entry->stopping = true;
            entry->stop_done = entry->stop_promise.get_future().share();
            proc = entry->proc;
        }
    }

    if (in_flight.valid()) {
        // Another Stop owns the teardown.
        in_flight.wait();
        return Status::Ok();
    }

    bool forced = proc->Terminate(options_.stop_grace);
    if (forced) {
        spdlog::warn("[{}] Worker pid={} ignored SIGTERM for {}ms, killed", name, proc->pid(),
                     options_.stop_grace.count());
        utils::Metrics::Instance().worker_force_kills_total().Increment();
    }
    proc->JoinReader();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.erase(name);
        stopped_.insert(name);
    }
    utils::Metrics::Instance().workers_active().Decrement();
    spdlog::info("[{}] Worker stopped ({})", name, proc->DescribeExit());
    entry->stop_promise.set_value();
    return Status::Ok();
}

std::optional<ProbeResult> PosixProcessController::Probe(const std::string& name) {
    auto entry = Find(name);
    if (!entry) return std::nullopt;

    std::shared_ptr<WorkerProcess> proc;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proc = entry->proc;
        stopping = entry->stopping;
    }

    ProbeResult result;
    if (!proc) {
        result.alive = true;
        result.reason = "starting";
        return result;
    }

    result.alive = proc->Poll();
    if (result.alive) {
        result.reason = stopping ? "stopping" : DescribeHealth(*proc);
        return result;
    }

    result.exit_code = proc->GetExitCode();
    result.reason = SummarizeExit(*proc);

    bool first_report = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        first_report = !entry->exit_reported && !entry->stopping;
        entry->exit_reported = true;
    }
    if (first_report) {
        spdlog::warn("[{}] {}", name, result.reason);
        utils::Metrics::Instance().worker_exits_total().Increment();
    }
    return result;
}

std::string PosixProcessController::DescribeHealth(const WorkerProcess& proc) const {
    auto error_line = proc.GetLastErrorLine();
    if (!error_line.empty()) {
        return "worker error: " + error_line;
    }
    // Fixed text: the reason is persisted only when it changes.
    if (proc.GetLastOutputAgeMs() > options_.stall_timeout.count()) {
        return "no output from worker for over " + FormatDuration(options_.stall_timeout);
    }
    if (proc.GetState() == State::STARTING) {
        return "starting";
    }
    return "healthy";
}

std::string PosixProcessController::SummarizeExit(const WorkerProcess& proc) const {
    std::string reason = "worker " + proc.DescribeExit();
    auto lines = proc.log().LastLines(options_.reason_lines);
    if (!lines.empty()) {
        reason += ": ";
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) reason += " | ";
            reason += lines[i];
        }
    }
    return reason;
}

std::optional<std::string> PosixProcessController::TailLog(const std::string& name, size_t max_bytes) {
    auto entry = Find(name);
    if (!entry) return std::nullopt;

    std::shared_ptr<WorkerProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proc = entry->proc;
    }
    if (!proc) return std::string();
    return proc->log().Tail(max_bytes);
}

Status PosixProcessController::ClearError(const std::string& name) {
    auto entry = Find(name);
    if (!entry) {
        return Status::Error(ErrorCode::NOT_FOUND, "no worker for '" + name + "'");
    }
    std::shared_ptr<WorkerProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proc = entry->proc;
    }
    if (proc) proc->ClearError();
    return Status::Ok();
}

void PosixProcessController::Forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.erase(name);
}

size_t PosixProcessController::RememberedStopCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_.size();
}

std::vector<std::string> PosixProcessController::ActiveWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(workers_.size());
    for (const auto& [name, entry] : workers_) {
        names.push_back(name);
    }
    return names;
}

void PosixProcessController::StopAll(std::chrono::steady_clock::time_point deadline) {
    auto names = ActiveWorkers();
    if (names.empty()) return;

    spdlog::info("Stopping {} worker(s)", names.size());
    std::vector<std::pair<std::string, std::future<Status>>> pending;
    for (const auto& name : names) {
        pending.emplace_back(name, std::async(std::launch::async, [this, name] { return Stop(name); }));
    }

    for (auto& [name, fut] : pending) {
        if (fut.wait_until(deadline) == std::future_status::ready) continue;

        spdlog::warn("[{}] Shutdown deadline passed, killing worker", name);
        if (auto entry = Find(name)) {
            std::shared_ptr<WorkerProcess> proc;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                proc = entry->proc;
            }
            if (proc) proc->Kill();
        }
    }

    for (auto& [name, fut] : pending) {
        auto st = fut.get();
        if (!st && st.code != ErrorCode::NOT_FOUND) {
            spdlog::warn("[{}] Stop during shutdown: {}", name, st.message);
        }
    }
}

pid_t PosixProcessController::GetPid(const std::string& name) const {
    auto entry = Find(name);
    if (!entry) return -1;
    std::lock_guard<std::mutex> lock(mutex_);
    return entry->proc ? entry->proc->pid() : -1;
}

} // namespace rtmp2rtsp::worker
