#pragma once
#include <memory>
#include "rtmp2rtsp/v1/relay.grpc.pb.h"
#include "service/stream_query.hpp"
#include "service/stream_supervisor.hpp"

namespace rtmp2rtsp::service {

inline constexpr size_t kDefaultLogTailBytes = 64 * 1024;

grpc::Status ToGrpcStatus(const model::Status& status);

class RelayServiceImpl final : public rtmp2rtsp::v1::StreamRelayService::Service {
public:
    RelayServiceImpl(std::shared_ptr<StreamSupervisor> supervisor, std::shared_ptr<StreamQuery> query);

    grpc::Status AddStream(grpc::ServerContext* context,
                           const rtmp2rtsp::v1::AddStreamRequest* request,
                           rtmp2rtsp::v1::AddStreamResponse* response) override;

    grpc::Status RemoveStream(grpc::ServerContext* context,
                              const rtmp2rtsp::v1::RemoveStreamRequest* request,
                              rtmp2rtsp::v1::RemoveStreamResponse* response) override;

    grpc::Status ReplaceStream(grpc::ServerContext* context,
                               const rtmp2rtsp::v1::ReplaceStreamRequest* request,
                               rtmp2rtsp::v1::ReplaceStreamResponse* response) override;

    grpc::Status ListStreams(grpc::ServerContext* context,
                             const rtmp2rtsp::v1::ListStreamsRequest* request,
                             rtmp2rtsp::v1::ListStreamsResponse* response) override;

    grpc::Status GetStream(grpc::ServerContext* context,
                           const rtmp2rtsp::v1::GetStreamRequest* request,
                           rtmp2rtsp::v1::GetStreamResponse* response) override;

    grpc::Status GetStreamLogs(grpc::ServerContext* context,
                               const rtmp2rtsp::v1::GetStreamLogsRequest* request,
                               rtmp2rtsp::v1::GetStreamLogsResponse* response) override;

    grpc::Status ClearStreamError(grpc::ServerContext* context,
                                  const rtmp2rtsp::v1::ClearStreamErrorRequest* request,
                                  rtmp2rtsp::v1::ClearStreamErrorResponse* response) override;

    grpc::Status Health(grpc::ServerContext* context,
                        const rtmp2rtsp::v1::HealthRequest* request,
                        rtmp2rtsp::v1::HealthResponse* response) override;

private:
    std::shared_ptr<StreamSupervisor> supervisor_;
    std::shared_ptr<StreamQuery> query_;
};

} // namespace rtmp2rtsp::service
