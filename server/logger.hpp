// server/logger.hpp
// Colored category logging shared by every server component
#ifndef SERVER_LOGGER_HPP
#define SERVER_LOGGER_HPP

#include <atomic>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <string>
#include <mutex>

class Logger {
public:
    enum class Category {
        SERVER,
        HUB,
        SESSION,
        CHAT,
        CONFIG,
        LISTENER,
        WORLD,
        STORAGE,
        DEBUG,
        ERROR
    };

private:
    static inline std::mutex logMutex;
    static inline std::atomic<bool> enabled{true};
    static inline std::atomic<bool> verbose{false};

    // ANSI color codes for different categories
    static const char* getCategoryColor(Category cat) {
        switch (cat) {
            case Category::SERVER:   return "\033[1;36m"; // Cyan
            case Category::HUB:      return "\033[1;32m"; // Green
            case Category::SESSION:  return "\033[1;33m"; // Yellow
            case Category::CHAT:     return "\033[1;34m"; // Blue
            case Category::CONFIG:   return "\033[1;37m"; // White
            case Category::LISTENER: return "\033[1;35m"; // Magenta
            case Category::WORLD:    return "\033[0;32m"; // Dim green
            case Category::STORAGE:  return "\033[0;36m"; // Dim cyan
            case Category::DEBUG:    return "\033[0;37m"; // Grey
            case Category::ERROR:    return "\033[1;31m"; // Red
            default:                 return "\033[0m";    // Reset
        }
    }

    static const char* getCategoryName(Category cat) {
        switch (cat) {
            case Category::SERVER:   return "Server";
            case Category::HUB:      return "Hub";
            case Category::SESSION:  return "Session";
            case Category::CHAT:     return "Chat";
            case Category::CONFIG:   return "Config";
            case Category::LISTENER: return "Listener";
            case Category::WORLD:    return "World";
            case Category::STORAGE:  return "Storage";
            case Category::DEBUG:    return "Debug";
            case Category::ERROR:    return "Error";
            default:                 return "Unknown";
        }
    }

    static const char* RESET_COLOR() { return "\033[0m"; }

    static std::string getTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(2) << (tm_now.tm_mon + 1) << "."
            << std::setw(2) << tm_now.tm_mday << " "
            << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":"
            << std::setw(2) << tm_now.tm_sec << "."
            << std::setw(3) << ms.count();

        return oss.str();
    }

public:
    // Tests switch output off entirely
    static void setEnabled(bool on) { enabled = on; }
    static void setVerbose(bool on) { verbose = on; }

    static void log(Category category, const std::string& message) {
        if (!enabled) return;
        if (category == Category::DEBUG && !verbose) return;
        std::lock_guard<std::mutex> lock(logMutex);

        std::ostream& out = (category == Category::ERROR) ? std::cerr : std::cout;
        out << getTimestamp() << " "
            << getCategoryColor(category) << "[" << getCategoryName(category) << "]" << RESET_COLOR()
            << " " << message << std::endl;
    }

    static void logChat(const std::string& username, const std::string& message) {
        if (!enabled) return;
        std::lock_guard<std::mutex> lock(logMutex);

        std::cout << getTimestamp() << " "
                  << getCategoryColor(Category::CHAT) << "[Chat]" << RESET_COLOR()
                  << "\t" << username << ": " << message << std::endl;
    }

    // Convenience methods for each category
    static void server(const std::string& msg) { log(Category::SERVER, msg); }
    static void hub(const std::string& msg) { log(Category::HUB, msg); }
    static void session(const std::string& msg) { log(Category::SESSION, msg); }
    static void chat(const std::string& username, const std::string& msg) { logChat(username, msg); }
    static void config(const std::string& msg) { log(Category::CONFIG, msg); }
    static void listener(const std::string& msg) { log(Category::LISTENER, msg); }
    static void world(const std::string& msg) { log(Category::WORLD, msg); }
    static void storage(const std::string& msg) { log(Category::STORAGE, msg); }
    static void debug(const std::string& msg) { log(Category::DEBUG, msg); }
    static void error(const std::string& msg) { log(Category::ERROR, msg); }
};

#endif // SERVER_LOGGER_HPP
