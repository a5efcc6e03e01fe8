// server/persistence.hpp
// Background flushing of dirty chunks and startup reload
#ifndef SERVER_PERSISTENCE_HPP
#define SERVER_PERSISTENCE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <boost/asio.hpp>

#include "chunk_storage.hpp"
#include "world.hpp"

namespace net = boost::asio;

struct FlushResult {
    std::size_t written = 0;
    std::size_t failed = 0;
    std::size_t stillDirty = 0;   // edited again while being written
};

class PersistenceEngine {
public:
    PersistenceEngine(World& world, ChunkStorage& storage, std::chrono::seconds interval, std::size_t dirtyThreshold);
    ~PersistenceEngine();

    PersistenceEngine(const PersistenceEngine&) = delete;
    PersistenceEngine& operator=(const PersistenceEngine&) = delete;

    // Adopts every stored record into the world; returns how many were loaded
    std::size_t loadAll();

    void start();
    // Stops the flush thread, then writes whatever is still dirty
    void stop();

    // Writes every dirty chunk now. Safe to call from any thread.
    FlushResult flush();

    // Hook for World: one more chunk went from clean to dirty
    void notifyDirty();

    uint64_t flushCount() const { return flushes; }
    bool isRunning() const { return running; }

private:
    World& world;
    ChunkStorage& storage;
    std::chrono::seconds interval;
    std::size_t dirtyThreshold;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    net::steady_timer timer;
    std::thread thread;

    std::mutex flushMutex;
    std::atomic<bool> running{false};
    std::atomic<bool> flushQueued{false};
    std::atomic<std::size_t> dirtySinceFlush{0};
    std::atomic<uint64_t> flushes{0};

    void scheduleFlush();
};

#endif // SERVER_PERSISTENCE_HPP
