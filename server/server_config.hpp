// server/server_config.hpp
// Server configuration file handler
#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstddef>
#include <exception>
#include <string>
#include <fstream>
#include <sstream>
#include "../shared/config.hpp"
#include "logger.hpp"

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = DEFAULT_PORT;
    unsigned int threads = 4;
    std::string motd = "Welcome to Craft!";
    std::string saveDir = "./world_save";
    unsigned int seed = PERLIN_SEED;
    int minY = DEFAULT_MIN_Y;
    int maxY = DEFAULT_MAX_Y;
    int dayLength = DAY_LENGTH;
    unsigned int idleTimeoutSeconds = 300;      // 0 disables
    unsigned int flushIntervalSeconds = 30;
    std::size_t flushDirtyThreshold = 64;
    std::size_t maxLineLength = DEFAULT_MAX_LINE_LENGTH;
    std::size_t maxOutboundBytes = DEFAULT_MAX_OUTBOUND_BYTES;
    bool verbose = false;

    // Load configuration from file
    bool loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            Logger::config("Config file not found, creating default: " + filename);
            return createDefaultConfig(filename);
        }

        std::string line;
        int lineNumber = 0;
        while (std::getline(file, line)) {
            ++lineNumber;
            // Skip empty lines and comments
            std::string trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            // Parse key=value pairs
            size_t equalsPos = trimmed.find('=');
            if (equalsPos == std::string::npos) {
                Logger::error(filename + ":" + std::to_string(lineNumber) + ": expected key=value");
                continue;
            }

            std::string key = trim(trimmed.substr(0, equalsPos));
            std::string value = trim(trimmed.substr(equalsPos + 1));
            if (!apply(key, value)) {
                Logger::error(filename + ":" + std::to_string(lineNumber) + ": ignoring " + key + "=" + value);
            }
        }

        Logger::config("Configuration loaded from " + filename);
        return true;
    }

    // Sets one option; false for unknown keys or unparsable values
    bool apply(const std::string& key, const std::string& value) {
        try {
            if (key == "host") {
                host = value;
            } else if (key == "port") {
                unsigned long v = std::stoul(value);
                if (v > 65535) return false;
                port = static_cast<unsigned short>(v);
            } else if (key == "threads") {
                unsigned long v = std::stoul(value);
                if (v == 0) return false;
                threads = static_cast<unsigned int>(v);
            } else if (key == "motd") {
                motd = value;
            } else if (key == "save_dir") {
                saveDir = value;
            } else if (key == "seed") {
                seed = static_cast<unsigned int>(std::stoul(value));
            } else if (key == "min_y") {
                minY = std::stoi(value);
            } else if (key == "max_y") {
                maxY = std::stoi(value);
            } else if (key == "day_length") {
                dayLength = std::stoi(value);
            } else if (key == "idle_timeout_seconds") {
                idleTimeoutSeconds = static_cast<unsigned int>(std::stoul(value));
            } else if (key == "flush_interval_seconds") {
                unsigned long v = std::stoul(value);
                if (v == 0) return false;
                flushIntervalSeconds = static_cast<unsigned int>(v);
            } else if (key == "flush_dirty_threshold") {
                flushDirtyThreshold = std::stoul(value);
            } else if (key == "max_line_length") {
                maxLineLength = std::stoul(value);
            } else if (key == "max_outbound_bytes") {
                maxOutboundBytes = std::stoul(value);
            } else if (key == "verbose") {
                verbose = (value == "true" || value == "1" || value == "yes");
            } else {
                return false;
            }
        } catch (const std::exception& e) {
            Logger::error("Invalid value for " + key + ": " + value + " (" + e.what() + ")");
            return false;
        }
        return true;
    }

    // Create default configuration file
    bool createDefaultConfig(const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            Logger::error("Failed to create config file: " + filename);
            return false;
        }

        file << "# blockhub server configuration\n";
        file << "# Edit these settings to customize your server\n\n";
        file << "# Listening address and port (default: 0.0.0.0:" << DEFAULT_PORT << ")\n";
        file << "host=" << host << "\n";
        file << "port=" << port << "\n\n";
        file << "# Worker threads serving connections\n";
        file << "threads=" << threads << "\n\n";
        file << "# Message of the day - sent to players when they join\n";
        file << "motd=" << motd << "\n\n";
        file << "# World storage and terrain\n";
        file << "save_dir=" << saveDir << "\n";
        file << "seed=" << seed << "\n";
        file << "min_y=" << minY << "\n";
        file << "max_y=" << maxY << "\n";
        file << "day_length=" << dayLength << "\n\n";
        file << "# Persistence: flush every N seconds, or sooner once this many chunks are dirty\n";
        file << "flush_interval_seconds=" << flushIntervalSeconds << "\n";
        file << "flush_dirty_threshold=" << flushDirtyThreshold << "\n\n";
        file << "# Connection limits (idle timeout 0 disables)\n";
        file << "idle_timeout_seconds=" << idleTimeoutSeconds << "\n";
        file << "max_line_length=" << maxLineLength << "\n";
        file << "max_outbound_bytes=" << maxOutboundBytes << "\n\n";
        file << "verbose=" << (verbose ? "true" : "false") << "\n";

        Logger::config("Default configuration created: " + filename);
        return true;
    }

private:
    // Helper function to trim whitespace
    static std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }
};

#endif // SERVER_CONFIG_HPP
