/**
 * @file test_chunk_storage.cpp
 * @brief Per-chunk record files on disk.
 */

#include <catch2/catch.hpp>

#include "server/chunk_storage.hpp"
#include "shared/errors.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <fstream>

using namespace test_helpers;

namespace {

ChunkSnapshot edited_chunk(ChunkCoord coord) {
    Chunk chunk(coord);
    int x = coord.p * CHUNK_SIZE + 3;
    int z = coord.q * CHUNK_SIZE + 3;
    chunk.fill(x, 9, z, BLOCK_DIRT);
    chunk.set(x, 10, z, BLOCK_BRICK);
    return chunk.snapshot();
}

} // namespace

TEST_CASE("ChunkStorage saves and loads a record", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path() / "world");

    ChunkSnapshot snap = edited_chunk(ChunkCoord{-1, 2});
    storage.save(snap);

    REQUIRE(std::filesystem::exists(storage.pathFor(ChunkCoord{-1, 2})));
    auto loaded = storage.load(ChunkCoord{-1, 2});
    REQUIRE(loaded);
    REQUIRE(*loaded == snap);
}

TEST_CASE("ChunkStorage returns nothing for a chunk never saved", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());
    REQUIRE_FALSE(storage.load(ChunkCoord{0, 0}));
}

TEST_CASE("Saving again replaces the previous record", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());

    Chunk chunk(ChunkCoord{0, 0});
    chunk.set(1, 1, 1, BLOCK_STONE);
    storage.save(chunk.snapshot());
    chunk.set(1, 1, 1, BLOCK_GLASS);
    storage.save(chunk.snapshot());

    auto loaded = storage.load(ChunkCoord{0, 0});
    REQUIRE(loaded->materialAt(1, 1, 1) == BLOCK_GLASS);
    REQUIRE(loaded->revision == 2);
    REQUIRE_FALSE(std::filesystem::exists(storage.pathFor(ChunkCoord{0, 0}).string() + ".tmp"));
}

TEST_CASE("ChunkStorage::parseFilename accepts only chunk records", "[storage]") {
    REQUIRE((ChunkStorage::parseFilename("chunk_0_0.dat") == ChunkCoord{0, 0}));
    REQUIRE((ChunkStorage::parseFilename("chunk_-3_12.dat") == ChunkCoord{-3, 12}));
    REQUIRE_FALSE(ChunkStorage::parseFilename("chunk_1_2.dat.tmp"));
    REQUIRE_FALSE(ChunkStorage::parseFilename("chunk_1.dat"));
    REQUIRE_FALSE(ChunkStorage::parseFilename("chunk_1_2x.dat"));
    REQUIRE_FALSE(ChunkStorage::parseFilename("world.dat"));
    REQUIRE_FALSE(ChunkStorage::parseFilename("server.config"));
}

TEST_CASE("ChunkStorage::list finds saved records and skips leftovers", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());
    storage.save(edited_chunk(ChunkCoord{0, 0}));
    storage.save(edited_chunk(ChunkCoord{-2, 5}));
    std::ofstream(dir.path() / "chunk_9_9.dat.tmp") << "partial";
    std::ofstream(dir.path() / "notes.txt") << "hello";

    auto coords = storage.list();
    REQUIRE(coords.size() == 2);
    REQUIRE(std::find(coords.begin(), coords.end(), ChunkCoord{0, 0}) != coords.end());
    REQUIRE(std::find(coords.begin(), coords.end(), ChunkCoord{-2, 5}) != coords.end());
}

TEST_CASE("ChunkStorage::list on a missing directory is empty", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path() / "does_not_exist");
    REQUIRE(storage.list().empty());
}

TEST_CASE("Corrupt or misplaced records raise StorageError", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path());

    SECTION("garbage bytes") {
        std::ofstream(storage.pathFor(ChunkCoord{1, 1}), std::ios::binary) << "garbage";
        REQUIRE_THROWS_AS(storage.load(ChunkCoord{1, 1}), StorageError);
    }

    SECTION("record copied under another chunk's name") {
        storage.save(edited_chunk(ChunkCoord{1, 1}));
        std::filesystem::copy_file(storage.pathFor(ChunkCoord{1, 1}), storage.pathFor(ChunkCoord{2, 2}));
        REQUIRE_THROWS_AS(storage.load(ChunkCoord{2, 2}), StorageError);
    }
}

TEST_CASE("Saving into an unusable directory raises StorageError", "[storage]") {
    TempDir dir;
    std::ofstream(dir.path() / "blocker") << "not a directory";
    ChunkStorage storage(dir.path() / "blocker");

    REQUIRE_THROWS_AS(storage.save(edited_chunk(ChunkCoord{0, 0})), StorageError);
}

TEST_CASE("Saved records are synced and leave no temporary file behind", "[storage]") {
    TempDir dir;
    ChunkStorage storage(dir.path() / "world");

    ChunkSnapshot first = edited_chunk(ChunkCoord{3, -4});
    storage.save(first);
    storage.save(first);

    REQUIRE_NOTHROW(ChunkStorage::syncPath(storage.pathFor(ChunkCoord{3, -4})));
    REQUIRE_NOTHROW(ChunkStorage::syncPath(storage.directory()));
    REQUIRE_FALSE(std::filesystem::exists(storage.pathFor(ChunkCoord{3, -4}).string() + ".tmp"));
    REQUIRE(*storage.load(ChunkCoord{3, -4}) == first);
    REQUIRE(storage.list().size() == 1);
}

TEST_CASE("Syncing a missing path raises StorageError", "[storage]") {
    TempDir dir;
    REQUIRE_THROWS_AS(ChunkStorage::syncPath(dir.path() / "absent.dat"), StorageError);
}
