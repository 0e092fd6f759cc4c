#include "core/panel_services.hpp"
#include "core/websocket_server.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace panelsense;

namespace {

std::atomic<bool> g_shutdownRequested{false};

void handleSignal(int /*signal*/) {
    g_shutdownRequested = true;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Initialize logging
        utils::Logger::initialize();

        std::string configPath = "config/server.json";
        int portOverride = 0;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                portOverride = std::stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --config <path>  Configuration file (default: config/server.json)\n"
                          << "  --port <port>    Override the server port\n"
                          << "  --help, -h       Show this help message\n";
                return 0;
            }
        }

        // Load configuration
        auto config = utils::Config::load(configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));
        int port = portOverride > 0 ? portOverride : config.getPort();

        core::PanelServices services(config);
        core::WebSocketServer server(port, services);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        // The loop owns the main thread; a watcher turns signals into stop()
        std::atomic<bool> serverDone{false};
        std::thread watcher([&server, &serverDone]() {
            while (!serverDone && !g_shutdownRequested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            if (g_shutdownRequested) {
                server.stop();
            }
        });

        utils::Logger::info("Starting PanelSense server on port " + std::to_string(port));
        server.start();
        server.run();

        serverDone = true;
        watcher.join();

        utils::Logger::info("Shutting down...");
        services.stop();

        size_t errors = utils::ErrorHandler::getInstance().getErrorCount();
        if (errors > 0) {
            utils::Logger::info("Contained errors during this run: " + std::to_string(errors));
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
