/**
 * @file test_world_generation.cpp
 * @brief Deterministic default terrain.
 */

#include <catch2/catch.hpp>

#include "shared/world_generation.hpp"

TEST_CASE("Terrain generation is deterministic for a seed", "[worldgen]") {
    TerrainGenerator a(1234);
    TerrainGenerator b(1234);

    Chunk first(ChunkCoord{0, 0});
    Chunk second(ChunkCoord{0, 0});
    a.generate(first);
    b.generate(second);

    REQUIRE(first.snapshot() == second.snapshot());
    REQUIRE(first.size() > 0);
}

TEST_CASE("Generated chunks stay inside their column and are clean", "[worldgen]") {
    TerrainGenerator generator;
    Chunk chunk(ChunkCoord{-2, 5});
    generator.generate(chunk);

    ChunkSnapshot snap = chunk.snapshot();
    REQUIRE_FALSE(chunk.isDirty());
    REQUIRE(snap.revision == 0);
    for (const BlockRecord& b : snap.blocks) {
        REQUIRE(chunk.contains(b.x, b.z));
        REQUIRE(b.w > MATERIAL_AIR);
        REQUIRE(b.w <= MAX_MATERIAL_ID);
        REQUIRE(b.revision == 0);
    }
}

TEST_CASE("Every column is filled up to its height", "[worldgen]") {
    TerrainGenerator generator;
    Chunk chunk(ChunkCoord{0, 0});
    generator.generate(chunk);

    for (int x = 0; x < CHUNK_SIZE; x += 7) {
        for (int z = 0; z < CHUNK_SIZE; z += 5) {
            bool sand = false;
            int h = generator.columnHeight(x, z, &sand);
            REQUIRE(h >= WATER_LEVEL);
            REQUIRE(chunk.get(x, 0, z) == (sand ? BLOCK_SAND : BLOCK_GRASS));
            REQUIRE(chunk.highestAt(x, z) >= h - 1);
        }
    }
}
