#include "worker/worker_command.hpp"
#include "utils/logger.hpp"

namespace rtmp2rtsp::worker {

std::string WorkerCommand::ToString() const {
    std::string out = binary;
    for (const auto& a : args) {
        out += ' ';
        out += utils::Logger::RedactUrl(a);
    }
    return out;
}

WorkerCommand BuildFfmpegCommand(const model::StreamConfig& config,
                                 const std::string& relay_host,
                                 const std::string& binary) {
    WorkerCommand cmd;
    cmd.binary = binary;
    cmd.args = {
        "-re",
        "-i", config.source_url,
        "-c", "copy",
        "-bufsize", "5000k",
        "-f", "rtsp",
        "-rtsp_transport", "tcp",
        "-timeout", "60",
        "rtsp://" + relay_host + ":" + std::to_string(config.rtsp_port) + "/" + config.name,
    };
    return cmd;
}

CommandBuilder MakeFfmpegCommandBuilder(std::string relay_host, std::string binary) {
    return [relay_host = std::move(relay_host), binary = std::move(binary)](const model::StreamConfig& config) {
        return BuildFfmpegCommand(config, relay_host, binary);
    };
}

} // namespace rtmp2rtsp::worker
