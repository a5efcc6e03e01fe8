// server/world.cpp
#include "world.hpp"
#include "chunk_storage.hpp"
#include "logger.hpp"
#include "../shared/errors.hpp"

#include <mutex>

World::World(unsigned int seed, int minY, int maxY, ChunkStorage* storage)
    : generator(seed), minHeight(minY), maxHeight(maxY), storage(storage) {}

std::shared_ptr<Chunk> World::findChunk(int p, int q) const {
    std::shared_lock<std::shared_mutex> lock(chunksMutex);
    auto it = chunks.find(ChunkCoord{p, q});
    return it == chunks.end() ? nullptr : it->second;
}

bool World::chunkInRange(int p, int q) {
    auto fits = [](int c) {
        const int64_t first = static_cast<int64_t>(c) * CHUNK_SIZE;
        const int64_t last = first + CHUNK_SIZE - 1;
        return first >= INT_MIN && last <= INT_MAX;
    };
    return fits(p) && fits(q);
}

std::shared_ptr<Chunk> World::getOrLoadChunk(int p, int q) {
    if (!chunkInRange(p, q)) {
        throw OutOfRangeError("chunk (" + std::to_string(p) + ", " + std::to_string(q) + ") outside the world");
    }
    if (auto chunk = findChunk(p, q)) {
        return chunk;
    }

    // Load or generate without holding the map lock so other chunks stay reachable.
    // Two racing loaders produce identical chunks; the first insert wins.
    ChunkCoord coord{p, q};
    std::shared_ptr<Chunk> fresh = loadOrGenerate(coord);

    std::unique_lock<std::shared_mutex> lock(chunksMutex);
    auto [it, inserted] = chunks.try_emplace(coord, fresh);
    return it->second;
}

std::shared_ptr<Chunk> World::loadOrGenerate(ChunkCoord coord) const {
    auto chunk = std::make_shared<Chunk>(coord);
    if (storage) {
        try {
            if (auto snap = storage->load(coord)) {
                chunk->restore(*snap);
                Logger::debug("Loaded chunk (" + std::to_string(coord.p) + "," + std::to_string(coord.q) + ") from disk");
                return chunk;
            }
        } catch (const StorageError& e) {
            Logger::error("Storage: " + std::string(e.what()) + " - regenerating chunk");
        }
    }
    generator.generate(*chunk);
    Logger::debug("Generated chunk (" + std::to_string(coord.p) + "," + std::to_string(coord.q) + ")");
    return chunk;
}

BlockChange World::setBlock(int x, int y, int z, int w, const BlockObserver& onApplied) {
    if (y < minHeight || y > maxHeight) {
        throw OutOfRangeError("y=" + std::to_string(y) + " outside [" + std::to_string(minHeight) + ", " +
                              std::to_string(maxHeight) + "]");
    }
    if (w < MATERIAL_AIR || w > MAX_MATERIAL_ID) {
        throw OutOfRangeError("invalid material " + std::to_string(w));
    }

    ChunkCoord coord = chunkOf(x, z);
    std::shared_ptr<Chunk> chunk = getOrLoadChunk(coord.p, coord.q);

    BlockChange change{coord, x, y, z, w, 0};
    bool becameDirty = false;
    chunk->setAnd(x, y, z, w, &becameDirty, [&](uint64_t revision) {
        change.revision = revision;
        if (onApplied) onApplied(change);
    });

    if (becameDirty && dirtyListener) {
        dirtyListener();
    }
    return change;
}

int World::getBlock(int x, int y, int z) {
    ChunkCoord coord = chunkOf(x, z);
    return getOrLoadChunk(coord.p, coord.q)->get(x, y, z);
}

int World::highestBlock(int x, int z) {
    ChunkCoord coord = chunkOf(x, z);
    return getOrLoadChunk(coord.p, coord.q)->highestAt(x, z);
}

ChunkSnapshot World::snapshotChunk(int p, int q) {
    return getOrLoadChunk(p, q)->snapshot();
}

bool World::adoptChunk(const ChunkSnapshot& snap) {
    auto chunk = std::make_shared<Chunk>(snap.coord);
    chunk->restore(snap);

    std::unique_lock<std::shared_mutex> lock(chunksMutex);
    return chunks.try_emplace(snap.coord, std::move(chunk)).second;
}

bool World::unloadChunk(int p, int q) {
    std::unique_lock<std::shared_mutex> lock(chunksMutex);
    auto it = chunks.find(ChunkCoord{p, q});
    if (it == chunks.end()) return false;

    // Nobody can pick up a new reference while the map is exclusively locked
    if (it->second.use_count() > 1 || it->second->isDirty()) {
        return false;
    }
    chunks.erase(it);
    return true;
}

std::vector<std::shared_ptr<Chunk>> World::dirtyChunks() const {
    std::vector<std::shared_ptr<Chunk>> result;
    std::shared_lock<std::shared_mutex> lock(chunksMutex);
    for (const auto& [coord, chunk] : chunks) {
        if (chunk->isDirty()) {
            result.push_back(chunk);
        }
    }
    return result;
}

std::size_t World::loadedCount() const {
    std::shared_lock<std::shared_mutex> lock(chunksMutex);
    return chunks.size();
}
