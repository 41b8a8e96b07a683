#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "model/stream.hpp"

namespace rtmp2rtsp::service {

class StreamSupervisor;

struct StreamView {
    std::string name;
    std::string input_url;
    std::string output_url;
    std::string logs_url;
    int rtsp_port = 0;
    bool running = false;
    std::string reason;
    std::chrono::system_clock::time_point last_checked_at{};
    std::chrono::system_clock::time_point created_at{};
};

// Read-only view for the presentation layer. Holds no state of its own.
class StreamQuery {
public:
    StreamQuery(std::shared_ptr<const StreamSupervisor> supervisor, std::string public_host);

    std::vector<StreamView> ListStreams() const;
    std::optional<StreamView> GetStream(const std::string& name) const;
    std::optional<std::string> GetStreamLogs(const std::string& name, size_t max_bytes) const;

    static StreamView MakeView(const model::StreamRecord& record, const std::string& public_host);

private:
    std::shared_ptr<const StreamSupervisor> supervisor_;
    std::string public_host_;
};

} // namespace rtmp2rtsp::service
