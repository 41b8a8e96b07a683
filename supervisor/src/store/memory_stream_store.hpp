#pragma once
#include <shared_mutex>
#include <unordered_map>
#include "store/stream_store.hpp"

namespace rtmp2rtsp::store {

class MemoryStreamStore : public StreamStore {
public:
    MemoryStreamStore() = default;

    model::Status Put(const model::StreamConfig& config,
                      const model::StreamStatus& status,
                      bool replace) override;
    std::optional<model::StreamRecord> Get(const std::string& name) const override;
    std::vector<model::StreamRecord> List() const override;
    model::Status Delete(const std::string& name) override;
    model::Status UpdateStatus(const std::string& name, const model::StreamStatus& status) override;

protected:
    // Called with mutex_ held after every mutation. A failed Status rolls the
    // mutation back.
    virtual model::Status Commit() { return model::Status::Ok(); }

    // Caller must hold mutex_ exclusively.
    std::vector<model::StreamRecord> SnapshotLocked() const;
    void ResetLocked(std::vector<model::StreamRecord> records);

    mutable std::shared_mutex mutex_;

private:
    std::vector<model::StreamRecord> records_;
    std::unordered_map<std::string, size_t> index_;

    void ReindexLocked();
};

} // namespace rtmp2rtsp::store
