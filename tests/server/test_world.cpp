/**
 * @file test_world.cpp
 * @brief Chunk map, block edits, snapshots and concurrency.
 */

#include <catch2/catch.hpp>

#include "server/chunk_storage.hpp"
#include "server/world.hpp"
#include "shared/errors.hpp"
#include "test_utils.hpp"

#include <climits>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

using namespace test_helpers;

TEST_CASE("World: getOrLoadChunk generates once and reuses the chunk", "[world]") {
    World world;
    REQUIRE(world.loadedCount() == 0);

    auto a = world.getOrLoadChunk(0, 0);
    auto b = world.getOrLoadChunk(0, 0);
    REQUIRE(a == b);
    REQUIRE(world.loadedCount() == 1);
    REQUIRE((a->coord() == ChunkCoord{0, 0}));
}

TEST_CASE("World: snapshot after getOrLoad is consistent and repeatable", "[world]") {
    World world;
    ChunkSnapshot first = world.snapshotChunk(3, -2);
    ChunkSnapshot second = world.snapshotChunk(3, -2);
    REQUIRE(first == second);
    REQUIRE(world.getOrLoadChunk(3, -2)->snapshot() == first);
}

TEST_CASE("World: setBlock writes the owning chunk only", "[world]") {
    World world;
    ChunkSnapshot neighbour = world.snapshotChunk(1, 0);

    BlockChange change = world.setBlock(3, 10, 3, BLOCK_BRICK);
    REQUIRE((change.coord == ChunkCoord{0, 0}));
    REQUIRE(change.revision == 1);
    REQUIRE(world.getBlock(3, 10, 3) == BLOCK_BRICK);

    REQUIRE(world.snapshotChunk(1, 0) == neighbour);
    REQUIRE(world.getOrLoadChunk(0, 0)->isDirty());
    REQUIRE_FALSE(world.getOrLoadChunk(1, 0)->isDirty());
}

TEST_CASE("World: negative coordinates resolve to the floor chunk", "[world]") {
    World world;
    BlockChange change = world.setBlock(-1, 20, -33, BLOCK_GLASS);
    REQUIRE(change.coord.p == -1);
    REQUIRE(change.coord.q == -2);
    REQUIRE(world.snapshotChunk(-1, -2).materialAt(-1, 20, -33) == BLOCK_GLASS);
}

TEST_CASE("World: out-of-range edits are rejected without side effects", "[world]") {
    World world(PERLIN_SEED, 1, 255);
    ChunkSnapshot before = world.snapshotChunk(0, 0);

    REQUIRE_THROWS_AS(world.setBlock(0, 0, 0, BLOCK_STONE), OutOfRangeError);
    REQUIRE_THROWS_AS(world.setBlock(0, 256, 0, BLOCK_STONE), OutOfRangeError);
    REQUIRE_THROWS_AS(world.setBlock(0, 10, 0, 256), OutOfRangeError);
    REQUIRE_THROWS_AS(world.setBlock(0, 10, 0, -1), OutOfRangeError);

    REQUIRE(world.snapshotChunk(0, 0) == before);
    REQUIRE_FALSE(world.getOrLoadChunk(0, 0)->isDirty());

    REQUIRE_NOTHROW(world.setBlock(0, 1, 0, BLOCK_STONE));
    REQUIRE_NOTHROW(world.setBlock(0, 255, 0, MAX_MATERIAL_ID));
}

TEST_CASE("World: chunks whose columns overflow int are rejected", "[world]") {
    World world;
    const int lastP = INT_MAX / CHUNK_SIZE;
    const int firstP = INT_MIN / CHUNK_SIZE;

    REQUIRE(World::chunkInRange(lastP, firstP));
    REQUIRE_FALSE(World::chunkInRange(lastP + 1, 0));
    REQUIRE_FALSE(World::chunkInRange(0, firstP - 1));

    REQUIRE_THROWS_AS(world.getOrLoadChunk(INT_MAX / CHUNK_SIZE + 1, 0), OutOfRangeError);
    REQUIRE_THROWS_AS(world.getOrLoadChunk(0, INT_MIN / CHUNK_SIZE - 1), OutOfRangeError);
    REQUIRE_THROWS_AS(world.snapshotChunk(INT_MAX, INT_MIN), OutOfRangeError);
    REQUIRE(world.loadedCount() == 0);
}

TEST_CASE("World: the outermost chunks still generate and accept edits", "[world]") {
    World world;
    const int lastP = INT_MAX / CHUNK_SIZE;
    const int firstQ = INT_MIN / CHUNK_SIZE;

    auto chunk = world.getOrLoadChunk(lastP, firstQ);
    ChunkSnapshot snap = chunk->snapshot();
    REQUIRE_FALSE(snap.blocks.empty());
    for (const BlockRecord& b : snap.blocks) {
        REQUIRE(chunk->contains(b.x, b.z));
    }

    BlockChange change = world.setBlock(INT_MAX, 100, INT_MIN, BLOCK_BRICK);
    REQUIRE((change.coord == ChunkCoord{lastP, firstQ}));
    REQUIRE(world.getBlock(INT_MAX, 100, INT_MIN) == BLOCK_BRICK);
    REQUIRE(world.highestBlock(INT_MAX, INT_MIN) == 100);
}

TEST_CASE("World: the observer runs once per applied edit", "[world]") {
    World world;
    std::vector<BlockChange> seen;
    world.setBlock(5, 30, 5, BLOCK_WOOD, [&](const BlockChange& c) { seen.push_back(c); });

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].x == 5);
    REQUIRE(seen[0].w == BLOCK_WOOD);
    REQUIRE(seen[0].revision == 1);

    REQUIRE_THROWS_AS(world.setBlock(5, 0, 5, BLOCK_WOOD, [&](const BlockChange& c) { seen.push_back(c); }),
                      OutOfRangeError);
    REQUIRE(seen.size() == 1);
}

TEST_CASE("World: the dirty listener fires when a clean chunk becomes dirty", "[world]") {
    World world;
    int notified = 0;
    world.setDirtyListener([&]() { ++notified; });

    world.setBlock(1, 40, 1, BLOCK_STONE);
    world.setBlock(2, 40, 1, BLOCK_STONE);
    REQUIRE(notified == 1);

    world.setBlock(40, 40, 1, BLOCK_STONE);
    REQUIRE(notified == 2);

    auto chunk = world.getOrLoadChunk(0, 0);
    chunk->markClean(chunk->revision());
    world.setBlock(3, 40, 1, BLOCK_STONE);
    REQUIRE(notified == 3);
}

TEST_CASE("World: dirtyChunks lists only edited chunks", "[world]") {
    World world;
    world.getOrLoadChunk(5, 5);
    world.setBlock(0, 50, 0, BLOCK_STONE);
    world.setBlock(-10, 50, 0, BLOCK_STONE);

    auto dirty = world.dirtyChunks();
    REQUIRE(dirty.size() == 2);
    for (const auto& chunk : dirty) {
        REQUIRE(chunk->isDirty());
        REQUIRE_FALSE((chunk->coord() == ChunkCoord{5, 5}));
    }
}

TEST_CASE("World: unloadChunk only evicts clean, unreferenced chunks", "[world]") {
    World world;
    world.setBlock(0, 50, 0, BLOCK_STONE);
    REQUIRE_FALSE(world.unloadChunk(0, 0));

    {
        auto held = world.getOrLoadChunk(1, 1);
        REQUIRE_FALSE(world.unloadChunk(1, 1));
    }
    REQUIRE(world.unloadChunk(1, 1));
    REQUIRE_FALSE(world.unloadChunk(1, 1));
    REQUIRE(world.loadedCount() == 1);
}

TEST_CASE("World: adoptChunk installs a stored record but never replaces a loaded chunk", "[world]") {
    World world;
    ChunkSnapshot stored;
    stored.coord = ChunkCoord{9, 9};
    stored.revision = 4;
    stored.blocks.push_back(BlockRecord{290, 12, 290, BLOCK_CHEST, 4});

    REQUIRE(world.adoptChunk(stored));
    REQUIRE(world.snapshotChunk(9, 9) == stored);
    REQUIRE_FALSE(world.getOrLoadChunk(9, 9)->isDirty());

    ChunkSnapshot other = stored;
    other.blocks[0].w = BLOCK_CLOUD;
    REQUIRE_FALSE(world.adoptChunk(other));
    REQUIRE(world.getBlock(290, 12, 290) == BLOCK_CHEST);
}

TEST_CASE("World: stored records take precedence over generation", "[world][storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());

    ChunkSnapshot stored;
    {
        World original(PERLIN_SEED, DEFAULT_MIN_Y, DEFAULT_MAX_Y, &storage);
        original.setBlock(3, 10, 3, BLOCK_BRICK);
        stored = original.snapshotChunk(0, 0);
        storage.save(stored);
    }

    World reloaded(PERLIN_SEED, DEFAULT_MIN_Y, DEFAULT_MAX_Y, &storage);
    REQUIRE(reloaded.snapshotChunk(0, 0) == stored);
    REQUIRE(reloaded.getBlock(3, 10, 3) == BLOCK_BRICK);
}

TEST_CASE("World: a corrupt record falls back to generated terrain", "[world][storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());
    {
        std::ofstream out(storage.pathFor(ChunkCoord{0, 0}), std::ios::binary);
        out << "not a chunk record";
    }

    World world(PERLIN_SEED, DEFAULT_MIN_Y, DEFAULT_MAX_Y, &storage);
    World fresh;
    REQUIRE(world.snapshotChunk(0, 0) == fresh.snapshotChunk(0, 0));
}

TEST_CASE("World: concurrent edits to one block end with the last applied write", "[world][concurrency]") {
    World world;
    const int threads = 8;
    const int editsPerThread = 200;

    std::mutex orderMutex;
    std::vector<int> applied;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < editsPerThread; ++i) {
                int w = 1 + (t * editsPerThread + i) % MAX_MATERIAL_ID;
                world.setBlock(7, 60, 7, w, [&](const BlockChange& c) {
                    std::lock_guard<std::mutex> lock(orderMutex);
                    applied.push_back(c.w);
                });
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(applied.size() == static_cast<std::size_t>(threads * editsPerThread));
    REQUIRE(world.getBlock(7, 60, 7) == applied.back());
    REQUIRE(world.getOrLoadChunk(0, 0)->revision() == static_cast<uint64_t>(threads * editsPerThread));
}

TEST_CASE("World: edits to different chunks proceed in parallel", "[world][concurrency]") {
    World world;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                world.setBlock(t * CHUNK_SIZE + (i % CHUNK_SIZE), 70, 0, BLOCK_PLANK);
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int t = 0; t < 4; ++t) {
        REQUIRE(world.getOrLoadChunk(t, 0)->revision() == 100);
    }
}
