#include "store/memory_stream_store.hpp"
#include <mutex>

namespace rtmp2rtsp::store {

using model::ErrorCode;
using model::Status;

Status MemoryStreamStore::Put(const model::StreamConfig& config,
                              const model::StreamStatus& status,
                              bool replace) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto backup = records_;

    auto it = index_.find(config.name);
    if (it != index_.end()) {
        if (!replace) {
            return Status::Error(ErrorCode::DUPLICATE_NAME, "stream '" + config.name + "' already exists");
        }
        auto& rec = records_[it->second];
        rec.config = config;
        rec.status = status;
    } else {
        model::StreamRecord rec{config, status, std::chrono::system_clock::now()};
        records_.push_back(std::move(rec));
        index_[config.name] = records_.size() - 1;
    }

    auto st = Commit();
    if (!st) {
        records_ = std::move(backup);
        ReindexLocked();
    }
    return st;
}

std::optional<model::StreamRecord> MemoryStreamStore::Get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return records_[it->second];
}

std::vector<model::StreamRecord> MemoryStreamStore::List() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_;
}

Status MemoryStreamStore::Delete(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return Status::Error(ErrorCode::NOT_FOUND, "stream '" + name + "' not found");
    }

    auto backup = records_;
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(it->second));
    ReindexLocked();

    auto st = Commit();
    if (!st) {
        records_ = std::move(backup);
        ReindexLocked();
    }
    return st;
}

Status MemoryStreamStore::UpdateStatus(const std::string& name, const model::StreamStatus& status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return Status::Error(ErrorCode::NOT_FOUND, "stream '" + name + "' not found");
    }

    auto& rec = records_[it->second];
    bool changed = rec.status.running != status.running || rec.status.reason != status.reason;
    auto previous = rec.status;
    rec.status = status;

    // A new last_checked_at alone does not warrant a rewrite of the state file.
    if (!changed) return Status::Ok();

    auto st = Commit();
    if (!st) rec.status = previous;
    return st;
}

std::vector<model::StreamRecord> MemoryStreamStore::SnapshotLocked() const {
    return records_;
}

void MemoryStreamStore::ResetLocked(std::vector<model::StreamRecord> records) {
    records_ = std::move(records);
    ReindexLocked();
}

void MemoryStreamStore::ReindexLocked() {
    index_.clear();
    for (size_t i = 0; i < records_.size(); ++i) {
        index_[records_[i].config.name] = i;
    }
}

} // namespace rtmp2rtsp::store
