#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "server/meeting_service_impl.hpp"

#include <cstdlib>
#include <csignal>
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("MEETCOORD_CONFIG")) {
        config_path = env;
    } else {
        config_path = meetcoord::common::GetConfigPath("app.example.json");
    }

    meetcoord::common::AppConfig config;
    try {
        config = meetcoord::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    meetcoord::common::InitLogger(config.logging);
    MEETCOORD_LOG_INFO("Meeting coordinator starting with config {}", config_path);

    meetcoord::server::MeetingServiceImpl meeting_service(config);
    meeting_service.Manager().StartBackgroundSweep();

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&meeting_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        MEETCOORD_LOG_ERROR("Failed to start gRPC server on {}", address);
        meeting_service.Manager().StopBackgroundSweep();
        return EXIT_FAILURE;
    }

    MEETCOORD_LOG_INFO("Meeting coordinator listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        MEETCOORD_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    meeting_service.Manager().StopBackgroundSweep();
    meetcoord::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
