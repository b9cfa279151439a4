#include "upload_server.h"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    g_shutdown_requested = signal;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--port N] [--grpc-port N] [--root DIR] [--verbose]"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        chunkpost::Config config;
        std::string error;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--config" && has_value) {
                if (!config.loadFromFile(argv[++i], error)) {
                    std::cerr << "Error: " << error << std::endl;
                    return 1;
                }
            } else if (arg == "--port" && has_value) {
                if (!config.set("http_port", argv[++i], error)) {
                    std::cerr << "Error: " << error << std::endl;
                    return 1;
                }
            } else if (arg == "--grpc-port" && has_value) {
                if (!config.set("grpc_port", argv[++i], error)) {
                    std::cerr << "Error: " << error << std::endl;
                    return 1;
                }
            } else if (arg == "--root" && has_value) {
                config.setUploadRoot(argv[++i]);
            } else if (arg == "--verbose") {
                config.setDebugLog(true);
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (config.isDebugLog()) {
            chunkpost::Utils::setDebugLogging(true);
        }

        chunkpost::UploadServer server(config);
        chunkpost::Status status = server.initialize();
        if (!status.ok()) {
            chunkpost::Utils::logError("Startup failed: " + status.toString());
            return 1;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!server.start()) {
            chunkpost::Utils::logError("Failed to start upload server");
            return 1;
        }

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        chunkpost::Utils::logInfo("Received signal " + std::to_string(g_shutdown_requested) + ", shutting down...");
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
