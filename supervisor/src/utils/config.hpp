#pragma once
#include <cstddef>
#include <string>

namespace rtmp2rtsp::utils {

struct Config {
    std::string grpc_addr = "0.0.0.0:50061";
    std::string metrics_addr = "0.0.0.0:9092";
    std::string log_level = "info";
    std::string state_file = "data/streams.json";

    // Host put into the rtsp:// URLs handed to clients.
    std::string public_host = "localhost";
    // Host the workers publish to.
    std::string relay_host = "localhost";
    std::string worker_binary = "ffmpeg";

    int reconcile_interval_ms = 5000;
    int stop_grace_ms = 5000;
    int shutdown_deadline_ms = 10000;
    size_t log_buffer_bytes = 256 * 1024;

    bool autostart_on_load = false;
    bool restart_on_crash = false;
    int restart_max_attempts = 5;

    static Config LoadFromEnv();

    // Flags override the values already in cfg. Throws std::invalid_argument
    // on an unknown flag or a malformed number.
    static void ParseArgs(int argc, char** argv, Config& cfg);
};

} // namespace rtmp2rtsp::utils
