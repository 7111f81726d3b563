#include "gridstore_server/collection_service.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::unique_ptr<grpc::Server> g_server;
static std::atomic<bool> g_shutdown_requested(false);

// ============================================================================
// Configuration
// ============================================================================
const std::string DEFAULT_HOST = "0.0.0.0";
const int DEFAULT_PORT = 27017;
const int STATS_INTERVAL_SECONDS = 30;

struct ServerConfig {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    bool show_help = false;
};

ServerConfig ParseArgs(int argc, char* argv[]) {
    ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--port" && i + 1 < argc) {
            config.port = std::stoi(argv[++i]);
        } else if (arg == "--host" && i + 1 < argc) {
            config.host = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return config;
}

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
        if (g_server) {
            g_server->Shutdown();
        }
    }
}

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ParseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        return 1;
    }

    if (config.show_help) {
        std::cout << "Usage: gridstore_server [options]" << std::endl
                  << "Options:" << std::endl
                  << "  --host <host>     Listen address (default: 0.0.0.0)" << std::endl
                  << "  --port <port>     Listen port (default: 27017)" << std::endl
                  << "  --help            Show this help message" << std::endl;
        return 0;
    }

    std::string server_address = config.host + ":" + std::to_string(config.port);

    std::cout << "================================" << std::endl
              << "  GridStore" << std::endl
              << "  Collection Server" << std::endl
              << "================================" << std::endl
              << "Server Address: " << server_address << std::endl
              << std::endl;

    auto backend = std::make_shared<gridstore_client::MemoryBackend>();
    auto service = std::make_unique<gridstore_server::CollectionServiceImpl>(backend);

    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    g_server = builder.BuildAndStart();

    if (!g_server) {
        std::cerr << "Failed to start server!" << std::endl;
        return 1;
    }

    std::cout << "Collection server listening on " << server_address << std::endl;
    std::cout << "Press Ctrl+C to shutdown..." << std::endl << std::endl;

    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    // Print statistics periodically (for monitoring)
    std::thread stats_thread([&service]() {
        while (!g_shutdown_requested.load()) {
            for (int i = 0; i < STATS_INTERVAL_SECONDS && !g_shutdown_requested.load(); ++i) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            if (!g_shutdown_requested.load()) {
                std::cout << "\n" << service->GetStatistics() << std::endl;
            }
        }
    });

    g_server->Wait();

    g_shutdown_requested.store(true);
    if (stats_thread.joinable()) {
        stats_thread.join();
    }

    std::cout << "Server shutdown complete." << std::endl;
    return 0;
}
