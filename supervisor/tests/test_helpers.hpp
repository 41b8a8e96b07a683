#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include "worker/worker_command.hpp"

namespace rtmp2rtsp::test_support {

// Polls pred until it holds or timeout expires.
inline bool WaitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

// Runs "/bin/sh -c <script>" where the script is looked up by stream name.
// Unknown names get a long-running silent worker.
inline worker::CommandBuilder ShellBuilder(std::map<std::string, std::string> scripts) {
    return [scripts = std::move(scripts)](const model::StreamConfig& config) {
        auto it = scripts.find(config.name);
        worker::WorkerCommand cmd;
        cmd.binary = "/bin/sh";
        cmd.args = {"-c", it != scripts.end() ? it->second : "echo started; exec sleep 30"};
        return cmd;
    };
}

inline model::StreamConfig MakeConfig(const std::string& name, int port = 8554) {
    return {name, "rtmp://example/live/" + name, port};
}

} // namespace rtmp2rtsp::test_support
