#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include "service/relay_service.hpp"
#include "service/stream_query.hpp"
#include "service/stream_supervisor.hpp"
#include "store/json_file_stream_store.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include "worker/posix_process_controller.hpp"

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_keep_running = false;
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace rtmp2rtsp;

    utils::Config cfg = utils::Config::LoadFromEnv();
    try {
        utils::Config::ParseArgs(argc, argv, cfg);
    } catch (const std::invalid_argument& e) {
        utils::Logger::Init("info");
        spdlog::error("Invalid arguments: {}", e.what());
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A worker that dies mid-write must not take the supervisor down.
    std::signal(SIGPIPE, SIG_IGN);

    utils::Logger::Init(cfg.log_level);
    utils::Metrics::Instance().Init(cfg.metrics_addr);

    spdlog::info("Starting RTMP to RTSP stream supervisor");
    spdlog::info("gRPC address: {}", cfg.grpc_addr);
    spdlog::info("Metrics address: {}", cfg.metrics_addr.empty() ? "disabled" : cfg.metrics_addr);
    spdlog::info("State file: {}", cfg.state_file);
    spdlog::info("Worker: {} publishing to {}, public host {}", cfg.worker_binary, cfg.relay_host, cfg.public_host);

    auto stream_store = std::make_shared<store::JsonFileStreamStore>(cfg.state_file);
    if (auto st = stream_store->Load(); !st) {
        spdlog::error("Failed to load state: {}", st.message);
        return 1;
    }

    worker::ControllerOptions controller_options;
    controller_options.log_buffer_bytes = cfg.log_buffer_bytes;
    controller_options.stop_grace = std::chrono::milliseconds(cfg.stop_grace_ms);
    auto process_controller = std::make_shared<worker::PosixProcessController>(
        worker::MakeFfmpegCommandBuilder(cfg.relay_host, cfg.worker_binary), controller_options);

    service::SupervisorOptions options;
    options.reconcile_interval = std::chrono::milliseconds(cfg.reconcile_interval_ms);
    options.shutdown_deadline = std::chrono::milliseconds(cfg.shutdown_deadline_ms);
    options.autostart_on_load = cfg.autostart_on_load;
    options.restart.enabled = cfg.restart_on_crash;
    options.restart.max_attempts = cfg.restart_max_attempts;

    auto supervisor = std::make_shared<service::StreamSupervisor>(stream_store, process_controller, options);
    supervisor->Recover();
    supervisor->StartReconciler();

    auto query = std::make_shared<service::StreamQuery>(supervisor, cfg.public_host);
    service::RelayServiceImpl relay_service(supervisor, query);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg.grpc_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(&relay_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("Failed to start gRPC server");
        supervisor->Shutdown();
        return 1;
    }

    spdlog::info("Stream supervisor is running");
    std::thread server_thread([&server] { server->Wait(); });

    while (g_keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down...");
    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
    server_thread.join();
    supervisor->Shutdown();

    spdlog::info("Graceful exit");
    return 0;
}
