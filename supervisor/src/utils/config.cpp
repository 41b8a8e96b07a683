#include "utils/config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace rtmp2rtsp::utils {

namespace {

bool ParseBool(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

int ParsePositive(const std::string& flag, const std::string& v) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(v, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": not a number: " + v);
    }
    if (pos != v.size() || n <= 0) {
        throw std::invalid_argument(flag + ": expected a positive integer, got " + v);
    }
    return n;
}

} // namespace

Config Config::LoadFromEnv() {
    Config c;

    if (const char* env = std::getenv("HOSTNAME"))
        c.public_host = env;
    if (const char* env = std::getenv("RELAY_HOST"))
        c.relay_host = env;
    if (const char* env = std::getenv("WORKER_BINARY"))
        c.worker_binary = env;
    if (const char* env = std::getenv("STATE_FILE"))
        c.state_file = env;
    if (const char* env = std::getenv("LOG_LEVEL"))
        c.log_level = env;

    if (const char* env = std::getenv("AUTOSTART_ON_LOAD"))
        c.autostart_on_load = ParseBool(env);
    if (const char* env = std::getenv("RESTART_ON_CRASH"))
        c.restart_on_crash = ParseBool(env);

    return c;
}

void Config::ParseArgs(int argc, char** argv, Config& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--autostart-on-load") cfg.autostart_on_load = true;
        else if (arg == "--restart-on-crash") cfg.restart_on_crash = true;
        else if (!has_value) throw std::invalid_argument("missing value for " + arg);
        else if (arg == "--grpc-addr") cfg.grpc_addr = argv[++i];
        else if (arg == "--metrics-addr") cfg.metrics_addr = argv[++i];
        else if (arg == "--log-level") cfg.log_level = argv[++i];
        else if (arg == "--state-file") cfg.state_file = argv[++i];
        else if (arg == "--public-host") cfg.public_host = argv[++i];
        else if (arg == "--relay-host") cfg.relay_host = argv[++i];
        else if (arg == "--worker-binary") cfg.worker_binary = argv[++i];
        else if (arg == "--reconcile-interval-ms") cfg.reconcile_interval_ms = ParsePositive(arg, argv[++i]);
        else if (arg == "--stop-grace-ms") cfg.stop_grace_ms = ParsePositive(arg, argv[++i]);
        else if (arg == "--shutdown-deadline-ms") cfg.shutdown_deadline_ms = ParsePositive(arg, argv[++i]);
        else if (arg == "--log-buffer-bytes") cfg.log_buffer_bytes = static_cast<size_t>(ParsePositive(arg, argv[++i]));
        else if (arg == "--restart-max-attempts") cfg.restart_max_attempts = ParsePositive(arg, argv[++i]);
        else throw std::invalid_argument("unknown flag " + arg);
    }
}

} // namespace rtmp2rtsp::utils
