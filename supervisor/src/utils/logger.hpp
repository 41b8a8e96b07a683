#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace rtmp2rtsp::utils {

class Logger {
public:
    static void Init(const std::string& log_level);
    // Masks user:pass@ in rtmp(s)/rtsp(s) URLs.
    static std::string RedactUrl(const std::string& url);
};

} // namespace rtmp2rtsp::utils
