#include "service/relay_service.hpp"

namespace rtmp2rtsp::service {

using model::ErrorCode;

namespace {

model::StreamConfig FromProto(const rtmp2rtsp::v1::StreamConfig& p) {
    model::StreamConfig c;
    c.name = p.name();
    c.source_url = p.source_url();
    c.rtsp_port = p.rtsp_port();
    return c;
}

void FillInfo(const StreamView& v, rtmp2rtsp::v1::StreamInfo* info) {
    info->set_name(v.name);
    info->set_input_url(v.input_url);
    info->set_output_url(v.output_url);
    info->set_rtsp_port(v.rtsp_port);
    info->set_running(v.running);
    info->set_reason(v.reason);
    info->set_last_checked_at_ms(model::ToUnixMillis(v.last_checked_at));
    info->set_created_at_ms(model::ToUnixMillis(v.created_at));
    info->set_logs_url(v.logs_url);
}

} // namespace

grpc::Status ToGrpcStatus(const model::Status& status) {
    switch (status.code) {
        case ErrorCode::OK: return grpc::Status::OK;
        case ErrorCode::INVALID_CONFIG: return grpc::Status(grpc::INVALID_ARGUMENT, status.message);
        case ErrorCode::DUPLICATE_NAME: return grpc::Status(grpc::ALREADY_EXISTS, status.message);
        case ErrorCode::NOT_FOUND: return grpc::Status(grpc::NOT_FOUND, status.message);
        case ErrorCode::ALREADY_RUNNING: return grpc::Status(grpc::FAILED_PRECONDITION, status.message);
        case ErrorCode::WORKER_START_FAILED: return grpc::Status(grpc::UNAVAILABLE, status.message);
        case ErrorCode::STORAGE_ERROR: return grpc::Status(grpc::INTERNAL, status.message);
        default: return grpc::Status(grpc::UNKNOWN, status.message);
    }
}

RelayServiceImpl::RelayServiceImpl(std::shared_ptr<StreamSupervisor> supervisor, std::shared_ptr<StreamQuery> query)
    : supervisor_(std::move(supervisor)), query_(std::move(query)) {}

grpc::Status RelayServiceImpl::AddStream(grpc::ServerContext* /*context*/,
                                         const rtmp2rtsp::v1::AddStreamRequest* request,
                                         rtmp2rtsp::v1::AddStreamResponse* response) {
    if (!request->has_config()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "config is required");
    }

    auto config = FromProto(request->config());
    auto st = supervisor_->AddStream(config);
    if (!st) return ToGrpcStatus(st);

    if (auto view = query_->GetStream(config.name)) {
        FillInfo(*view, response->mutable_stream());
    }
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::RemoveStream(grpc::ServerContext* /*context*/,
                                            const rtmp2rtsp::v1::RemoveStreamRequest* request,
                                            rtmp2rtsp::v1::RemoveStreamResponse* response) {
    if (request->name().empty()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "name is required");
    }

    auto st = supervisor_->RemoveStream(request->name());
    if (!st) return ToGrpcStatus(st);

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::ReplaceStream(grpc::ServerContext* /*context*/,
                                             const rtmp2rtsp::v1::ReplaceStreamRequest* request,
                                             rtmp2rtsp::v1::ReplaceStreamResponse* response) {
    if (!request->has_config()) {
        return grpc::Status(grpc::INVALID_ARGUMENT, "config is required");
    }

    auto config = FromProto(request->config());
    auto st = supervisor_->ReplaceStream(config);
    if (!st) return ToGrpcStatus(st);

    if (auto view = query_->GetStream(config.name)) {
        FillInfo(*view, response->mutable_stream());
    }
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::ListStreams(grpc::ServerContext* /*context*/,
                                           const rtmp2rtsp::v1::ListStreamsRequest* /*request*/,
                                           rtmp2rtsp::v1::ListStreamsResponse* response) {
    for (const auto& view : query_->ListStreams()) {
        FillInfo(view, response->add_streams());
    }
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::GetStream(grpc::ServerContext* /*context*/,
                                         const rtmp2rtsp::v1::GetStreamRequest* request,
                                         rtmp2rtsp::v1::GetStreamResponse* response) {
    auto view = query_->GetStream(request->name());
    if (!view) {
        return grpc::Status(grpc::NOT_FOUND, "stream '" + request->name() + "' not found");
    }
    FillInfo(*view, response->mutable_stream());
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::GetStreamLogs(grpc::ServerContext* /*context*/,
                                             const rtmp2rtsp::v1::GetStreamLogsRequest* request,
                                             rtmp2rtsp::v1::GetStreamLogsResponse* response) {
    size_t max_bytes = request->max_bytes() > 0 ? request->max_bytes() : kDefaultLogTailBytes;
    auto logs = query_->GetStreamLogs(request->name(), max_bytes);
    if (!logs) {
        return grpc::Status(grpc::NOT_FOUND, "stream '" + request->name() + "' not found");
    }
    response->set_data(*logs);
    return grpc::Status::OK;
}

grpc::Status RelayServiceImpl::ClearStreamError(grpc::ServerContext* /*context*/,
                                                const rtmp2rtsp::v1::ClearStreamErrorRequest* request,
                                                rtmp2rtsp::v1::ClearStreamErrorResponse* /*response*/) {
    if (request->name().empty()) {
        supervisor_->ClearAllErrors();
        return grpc::Status::OK;
    }
    return ToGrpcStatus(supervisor_->ClearStreamError(request->name()));
}

grpc::Status RelayServiceImpl::Health(grpc::ServerContext* /*context*/,
                                      const rtmp2rtsp::v1::HealthRequest* /*request*/,
                                      rtmp2rtsp::v1::HealthResponse* response) {
    response->set_status("SERVING");
    response->set_streams_configured(static_cast<int32_t>(supervisor_->ListStreams().size()));
    response->set_workers_active(static_cast<int32_t>(supervisor_->ActiveWorkerCount()));
    return grpc::Status::OK;
}

} // namespace rtmp2rtsp::service
