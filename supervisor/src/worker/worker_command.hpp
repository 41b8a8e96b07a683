#pragma once
#include <functional>
#include <string>
#include <vector>
#include "model/stream.hpp"

namespace rtmp2rtsp::worker {

struct WorkerCommand {
    std::string binary;             // resolved through PATH when it has no '/'
    std::vector<std::string> args;  // argv[1..]

    std::string ToString() const;
};

using CommandBuilder = std::function<WorkerCommand(const model::StreamConfig&)>;

// ffmpeg -re -i <source> -c copy ... rtsp://<relay_host>:<rtsp_port>/<name>
WorkerCommand BuildFfmpegCommand(const model::StreamConfig& config,
                                 const std::string& relay_host,
                                 const std::string& binary = "ffmpeg");

CommandBuilder MakeFfmpegCommandBuilder(std::string relay_host, std::string binary);

} // namespace rtmp2rtsp::worker
