#pragma once
#include <string>
#include <utility>

namespace rtmp2rtsp::model {

enum class ErrorCode {
    OK,
    INVALID_CONFIG,
    DUPLICATE_NAME,
    NOT_FOUND,
    ALREADY_RUNNING,
    WORKER_START_FAILED,
    STORAGE_ERROR
};

// Result of a mutating operation. Worker exits are never reported here;
// they end up in StreamStatus::reason.
struct Status {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    static Status Ok() { return {}; }
    static Status Error(ErrorCode c, std::string msg) { return {c, std::move(msg)}; }

    bool ok() const { return code == ErrorCode::OK; }
    explicit operator bool() const { return ok(); }
};

std::string ErrorCodeToString(ErrorCode code);

} // namespace rtmp2rtsp::model
