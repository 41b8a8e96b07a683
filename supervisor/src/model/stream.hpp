#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace rtmp2rtsp::model {

inline constexpr int kMinRtspPort = 1024;
inline constexpr int kMaxRtspPort = 65535;

struct StreamConfig {
    std::string name;
    std::string source_url;
    int rtsp_port = 8554;
};

struct StreamStatus {
    bool running = false;
    std::string reason;
    std::chrono::system_clock::time_point last_checked_at{};
};

struct StreamRecord {
    StreamConfig config;
    StreamStatus status;
    std::chrono::system_clock::time_point created_at{};
};

bool operator==(const StreamConfig& a, const StreamConfig& b);
inline bool operator!=(const StreamConfig& a, const StreamConfig& b) { return !(a == b); }

// Empty string when the config is acceptable, otherwise the first violation.
std::string ValidateStreamConfig(const StreamConfig& config);

std::string BuildOutputUrl(const StreamConfig& config, const std::string& public_host);

int64_t ToUnixMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromUnixMillis(int64_t ms);

} // namespace rtmp2rtsp::model
