/**
 * @file test_serialization.cpp
 * @brief Binary chunk record layout and corruption detection.
 */

#include <catch2/catch.hpp>

#include "shared/serialization.hpp"

namespace {

ChunkSnapshot sample_snapshot() {
    Chunk chunk(ChunkCoord{-1, 3});
    chunk.fill(-5, 10, 100, BLOCK_GRASS);
    chunk.fill(-5, 9, 100, BLOCK_DIRT);
    chunk.set(-32, 20, 96, BLOCK_BRICK);
    chunk.set(-5, 10, 100, MATERIAL_AIR);
    return chunk.snapshot();
}

} // namespace

TEST_CASE("Chunk records decode to the snapshot that was encoded", "[serialization]") {
    ChunkSnapshot snap = sample_snapshot();
    std::vector<uint8_t> bytes = Serialization::encodeChunk(snap);

    REQUIRE(bytes.size() == Serialization::RECORD_HEADER_SIZE + snap.blocks.size() * Serialization::RECORD_ENTRY_SIZE + 4);
    REQUIRE(bytes[0] == 'V');
    REQUIRE(bytes[3] == 'H');

    ChunkSnapshot back = Serialization::decodeChunk(bytes, "sample");
    REQUIRE(back == snap);
    REQUIRE(back.materialAt(-5, 10, 100) == MATERIAL_AIR);
    REQUIRE(back.materialAt(-32, 20, 96) == BLOCK_BRICK);
}

TEST_CASE("An empty chunk still produces a valid record", "[serialization]") {
    ChunkSnapshot empty;
    empty.coord = ChunkCoord{7, 7};
    auto bytes = Serialization::encodeChunk(empty);
    REQUIRE(Serialization::decodeChunk(bytes, "empty") == empty);
}

TEST_CASE("Corrupt chunk records raise StorageError", "[serialization]") {
    std::vector<uint8_t> good = Serialization::encodeChunk(sample_snapshot());

    SECTION("truncated") {
        std::vector<uint8_t> bytes(good.begin(), good.begin() + static_cast<long>(good.size() / 2));
        REQUIRE_THROWS_AS(Serialization::decodeChunk(bytes, "t"), StorageError);
    }

    SECTION("empty file") {
        REQUIRE_THROWS_AS(Serialization::decodeChunk({}, "t"), StorageError);
    }

    SECTION("bad magic") {
        auto bytes = good;
        bytes[0] = 'X';
        REQUIRE_THROWS_AS(Serialization::decodeChunk(bytes, "t"), StorageError);
    }

    SECTION("flipped payload byte") {
        auto bytes = good;
        bytes[Serialization::RECORD_HEADER_SIZE + 2] ^= 0x40;
        REQUIRE_THROWS_AS(Serialization::decodeChunk(bytes, "t"), StorageError);
    }

    SECTION("trailing garbage") {
        auto bytes = good;
        bytes.push_back(0);
        REQUIRE_THROWS_AS(Serialization::decodeChunk(bytes, "t"), StorageError);
    }
}

TEST_CASE("Checksum is FNV-1a", "[serialization]") {
    const uint8_t empty[1] = {0};
    REQUIRE(Serialization::fnv1a(empty, 0) == 2166136261u);

    const uint8_t a[1] = {'a'};
    REQUIRE(Serialization::fnv1a(a, 1) == 0xe40c292cu);
}
