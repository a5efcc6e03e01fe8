// server/persistence.cpp
#include "persistence.hpp"
#include "logger.hpp"
#include "../shared/errors.hpp"

PersistenceEngine::PersistenceEngine(World& world, ChunkStorage& storage, std::chrono::seconds interval,
                                     std::size_t dirtyThreshold)
    : world(world), storage(storage), interval(interval), dirtyThreshold(dirtyThreshold), timer(ioc) {}

PersistenceEngine::~PersistenceEngine() {
    stop();
}

std::size_t PersistenceEngine::loadAll() {
    std::vector<ChunkCoord> coords;
    try {
        coords = storage.list();
    } catch (const StorageError& e) {
        Logger::error("Storage: " + std::string(e.what()));
        return 0;
    }

    std::size_t loaded = 0;
    for (const ChunkCoord& coord : coords) {
        try {
            std::optional<ChunkSnapshot> snap = storage.load(coord);
            if (snap && world.adoptChunk(*snap)) {
                ++loaded;
            }
        } catch (const StorageError& e) {
            Logger::error("Storage: " + std::string(e.what()) + " - chunk will be regenerated");
        }
    }

    Logger::storage("Loaded " + std::to_string(loaded) + " chunk(s) from " + storage.directory().string());
    return loaded;
}

void PersistenceEngine::start() {
    if (running.exchange(true)) return;

    world.setDirtyListener([this]() { notifyDirty(); });
    work.emplace(net::make_work_guard(ioc));
    scheduleFlush();
    thread = std::thread([this]() { ioc.run(); });

    Logger::storage("Flushing every " + std::to_string(interval.count()) + "s or after " +
                    std::to_string(dirtyThreshold) + " dirty chunk(s)");
}

void PersistenceEngine::stop() {
    if (!running.exchange(false)) return;

    net::post(ioc, [this]() { timer.cancel(); });
    work.reset();
    if (thread.joinable()) {
        thread.join();
    }
    world.setDirtyListener({});

    FlushResult result = flush();
    Logger::storage("Final flush: " + std::to_string(result.written) + " written, " +
                    std::to_string(result.failed) + " failed");
}

void PersistenceEngine::scheduleFlush() {
    timer.expires_after(interval);
    timer.async_wait([this](boost::system::error_code ec) {
        if (ec) return;
        flush();
        scheduleFlush();
    });
}

void PersistenceEngine::notifyDirty() {
    std::size_t dirty = ++dirtySinceFlush;
    if (dirtyThreshold == 0 || dirty < dirtyThreshold) return;
    if (flushQueued.exchange(true)) return;

    Logger::debug("Dirty threshold reached, flushing early");
    net::post(ioc, [this]() {
        flushQueued = false;
        flush();
    });
}

FlushResult PersistenceEngine::flush() {
    std::lock_guard<std::mutex> lock(flushMutex);
    dirtySinceFlush = 0;

    FlushResult result;
    for (const auto& chunk : world.dirtyChunks()) {
        ChunkSnapshot snap = chunk->snapshot();
        try {
            storage.save(snap);
        } catch (const StorageError& e) {
            Logger::error("Storage: " + std::string(e.what()));
            ++result.failed;
            continue;
        }
        ++result.written;
        if (!chunk->markClean(snap.revision)) {
            ++result.stillDirty;
        }
    }

    ++flushes;
    if (result.written > 0 || result.failed > 0) {
        Logger::storage("Flushed " + std::to_string(result.written) + " chunk(s)" +
                        (result.failed ? ", " + std::to_string(result.failed) + " failed" : std::string()));
    }
    return result;
}
