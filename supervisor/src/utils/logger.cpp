#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rtmp2rtsp::utils {

void Logger::Init(const std::string& log_level) {
    auto console = spdlog::get("console");
    if (!console) console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    if (log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (log_level == "info") spdlog::set_level(spdlog::level::info);
    else if (log_level == "warn") spdlog::set_level(spdlog::level::warn);
    else if (log_level == "error") spdlog::set_level(spdlog::level::err);
    else spdlog::set_level(spdlog::level::info);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::string Logger::RedactUrl(const std::string& url) {
    auto pos_prot = url.find("://");
    if (pos_prot == std::string::npos) return url;

    std::string prot = url.substr(0, pos_prot);
    if (prot != "rtmp" && prot != "rtmps" && prot != "rtsp" && prot != "rtsps") return url;

    // Only the authority part may carry credentials.
    auto authority_end = url.find('/', pos_prot + 3);
    auto pos_at = url.rfind('@', authority_end == std::string::npos ? std::string::npos : authority_end);
    if (pos_at == std::string::npos || pos_at < pos_prot) return url;

    return prot + "://***:***" + url.substr(pos_at);
}

} // namespace rtmp2rtsp::utils
