#include "model/stream.hpp"
#include "model/status.hpp"
#include <algorithm>
#include <cctype>

namespace rtmp2rtsp::model {

bool operator==(const StreamConfig& a, const StreamConfig& b) {
    return a.name == b.name && a.source_url == b.source_url && a.rtsp_port == b.rtsp_port;
}

std::string ValidateStreamConfig(const StreamConfig& config) {
    if (config.name.empty()) {
        return "stream name must not be empty";
    }
    bool has_space = std::any_of(config.name.begin(), config.name.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    if (has_space) {
        return "stream name must not contain whitespace";
    }
    if (config.source_url.rfind("rtmp://", 0) != 0) {
        return "source url must start with rtmp://";
    }
    if (config.source_url.size() == 7) {
        return "source url has no host";
    }
    if (config.rtsp_port < kMinRtspPort || config.rtsp_port > kMaxRtspPort) {
        return "rtsp port must be between 1024 and 65535";
    }
    return "";
}

std::string BuildOutputUrl(const StreamConfig& config, const std::string& public_host) {
    return "rtsp://" + public_host + ":" + std::to_string(config.rtsp_port) + "/" + config.name;
}

int64_t ToUnixMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromUnixMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::DUPLICATE_NAME: return "DUPLICATE_NAME";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::ALREADY_RUNNING: return "ALREADY_RUNNING";
        case ErrorCode::WORKER_START_FAILED: return "WORKER_START_FAILED";
        case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace rtmp2rtsp::model
