#pragma once
#include <optional>
#include <string>
#include <vector>
#include "model/status.hpp"
#include "model/stream.hpp"

namespace rtmp2rtsp::store {

// Name -> (config, status) mapping. Every mutating call is durable before
// it returns OK. List() preserves insertion order; replacing a record keeps
// its position.
class StreamStore {
public:
    virtual ~StreamStore() = default;

    virtual model::Status Put(const model::StreamConfig& config,
                              const model::StreamStatus& status,
                              bool replace) = 0;

    virtual std::optional<model::StreamRecord> Get(const std::string& name) const = 0;
    virtual std::vector<model::StreamRecord> List() const = 0;

    virtual model::Status Delete(const std::string& name) = 0;

    // NOT_FOUND when the record is gone; reconciliation drops that result.
    virtual model::Status UpdateStatus(const std::string& name, const model::StreamStatus& status) = 0;
};

} // namespace rtmp2rtsp::store
