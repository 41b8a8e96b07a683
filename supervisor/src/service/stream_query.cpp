#include "service/stream_query.hpp"
#include "service/stream_supervisor.hpp"

namespace rtmp2rtsp::service {

StreamQuery::StreamQuery(std::shared_ptr<const StreamSupervisor> supervisor, std::string public_host)
    : supervisor_(std::move(supervisor)), public_host_(std::move(public_host)) {}

StreamView StreamQuery::MakeView(const model::StreamRecord& record, const std::string& public_host) {
    StreamView v;
    v.name = record.config.name;
    v.input_url = record.config.source_url;
    v.output_url = model::BuildOutputUrl(record.config, public_host);
    v.logs_url = "/logs/" + record.config.name;
    v.rtsp_port = record.config.rtsp_port;
    v.running = record.status.running;
    v.reason = record.status.reason;
    v.last_checked_at = record.status.last_checked_at;
    v.created_at = record.created_at;
    return v;
}

std::vector<StreamView> StreamQuery::ListStreams() const {
    std::vector<StreamView> views;
    for (const auto& rec : supervisor_->ListStreams()) {
        views.push_back(MakeView(rec, public_host_));
    }
    return views;
}

std::optional<StreamView> StreamQuery::GetStream(const std::string& name) const {
    auto rec = supervisor_->GetStream(name);
    if (!rec) return std::nullopt;
    return MakeView(*rec, public_host_);
}

std::optional<std::string> StreamQuery::GetStreamLogs(const std::string& name, size_t max_bytes) const {
    return supervisor_->GetStreamLogs(name, max_bytes);
}

} // namespace rtmp2rtsp::service
