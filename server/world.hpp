// server/world.hpp
// Authoritative chunk map with load-on-demand and per-chunk locking
#ifndef SERVER_WORLD_HPP
#define SERVER_WORLD_HPP

#include <climits>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "../shared/chunk.hpp"
#include "../shared/config.hpp"
#include "../shared/types.hpp"
#include "../shared/world_generation.hpp"

class ChunkStorage;

// Result of an applied edit, used for fan-out
struct BlockChange {
    ChunkCoord coord;
    int x, y, z;
    int w;
    uint64_t revision;
};

class World {
public:
    // Runs while the owning chunk is still locked
    using BlockObserver = std::function<void(const BlockChange&)>;
    using DirtyListener = std::function<void()>;

    World(unsigned int seed = PERLIN_SEED, int minY = DEFAULT_MIN_Y, int maxY = DEFAULT_MAX_Y,
          ChunkStorage* storage = nullptr);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // True when every block column of chunk (p, q) has an int coordinate
    static bool chunkInRange(int p, int q);

    // Throws OutOfRangeError when !chunkInRange(p, q)
    std::shared_ptr<Chunk> getOrLoadChunk(int p, int q);
    std::shared_ptr<Chunk> findChunk(int p, int q) const;

    // Throws OutOfRangeError for y outside [minY, maxY] or an invalid material
    BlockChange setBlock(int x, int y, int z, int w, const BlockObserver& onApplied = {});

    int getBlock(int x, int y, int z);
    int highestBlock(int x, int z);
    ChunkSnapshot snapshotChunk(int p, int q);

    // Install a stored record as the loaded chunk, replacing nothing already loaded
    bool adoptChunk(const ChunkSnapshot& snap);

    // Removes a clean chunk nobody else holds; false otherwise
    bool unloadChunk(int p, int q);

    std::vector<std::shared_ptr<Chunk>> dirtyChunks() const;
    std::size_t loadedCount() const;

    // Called whenever a clean chunk becomes dirty. Set before serving starts.
    void setDirtyListener(DirtyListener listener) { dirtyListener = std::move(listener); }

    int minY() const { return minHeight; }
    int maxY() const { return maxHeight; }

private:
    std::shared_ptr<Chunk> loadOrGenerate(ChunkCoord coord) const;

    TerrainGenerator generator;
    int minHeight;
    int maxHeight;
    ChunkStorage* storage;
    DirtyListener dirtyListener;

    mutable std::shared_mutex chunksMutex;
    std::unordered_map<ChunkCoord, std::shared_ptr<Chunk>> chunks;
};

#endif // SERVER_WORLD_HPP
