// server/main.cpp
// Craft-protocol game server entry point
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include "game_server.hpp"
#include "server_config.hpp"
#include "logger.hpp"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>    Configuration file (default: server.config)\n"
              << "  --host <address>   Address to listen on (default: 0.0.0.0)\n"
              << "  --port <port>      Port to listen on (default: " << DEFAULT_PORT << ")\n"
              << "  --save-dir <path>  World save directory (default: ./world_save)\n"
              << "  --threads <n>      Worker threads (default: 4)\n"
              << "  --verbose          Enable debug logging\n"
              << "  --help, -h         Show this help\n";
}

}

int main(int argc, char* argv[]) {
    // The config file is read first so command line arguments can override it
    std::string configPath = "server.config";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
    }

    ServerConfig config;
    config.loadFromFile(configPath);

    // Parse command line arguments (override config file)
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--host" && i + 1 < argc) {
            ok = config.apply("host", argv[++i]);
        } else if (arg == "--port" && i + 1 < argc) {
            ok = config.apply("port", argv[++i]);
        } else if (arg == "--save-dir" && i + 1 < argc) {
            ok = config.apply("save_dir", argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            ok = config.apply("threads", argv[++i]);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            Logger::error("Unknown argument: " + arg);
            printUsage(argv[0]);
            return 1;
        }
        if (!ok) {
            Logger::error("Invalid value for " + arg);
            return 1;
        }
    }

    Logger::setVerbose(config.verbose);

    std::cout << "╔════════════════════════════════════╗" << std::endl;
    std::cout << "║       blockhub Craft Server        ║" << std::endl;
    std::cout << "╚════════════════════════════════════╝" << std::endl;
    std::cout << "Address: " << config.host << ":" << config.port << std::endl;
    std::cout << "World:   " << config.saveDir << " (seed " << config.seed << ")" << std::endl;
    std::cout << "MOTD:    " << config.motd << std::endl;
    std::cout << std::endl;

    try {
        GameServer server(config);
        server.start();
        Logger::server("Press Ctrl+C to stop");

        // Signals are waited for on the main thread, away from the worker pool
        net::io_context signalContext{1};
        net::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            std::cout << std::endl;
            Logger::server("Received signal " + std::to_string(signal));
        });
        signalContext.run();

        server.stop();
    }
    catch (const std::exception& e) {
        Logger::error("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
