// shared/types.hpp
#ifndef SHARED_TYPES_HPP
#define SHARED_TYPES_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <tuple>

#include "config.hpp"

// Block Types (Craft material ids, 0 = air)
enum BlockType {
    BLOCK_EMPTY = 0,
    BLOCK_GRASS = 1,
    BLOCK_SAND = 2,
    BLOCK_STONE = 3,
    BLOCK_BRICK = 4,
    BLOCK_WOOD = 5,
    BLOCK_CEMENT = 6,
    BLOCK_DIRT = 7,
    BLOCK_PLANK = 8,
    BLOCK_SNOW = 9,
    BLOCK_GLASS = 10,
    BLOCK_COBBLE = 11,
    BLOCK_LIGHT_STONE = 12,
    BLOCK_DARK_STONE = 13,
    BLOCK_CHEST = 14,
    BLOCK_LEAVES = 15,
    BLOCK_CLOUD = 16,
    BLOCK_TALL_GRASS = 17,
    BLOCK_YELLOW_FLOWER = 18,
    BLOCK_RED_FLOWER = 19,
    BLOCK_PURPLE_FLOWER = 20,
    BLOCK_SUN_FLOWER = 21,
    BLOCK_WHITE_FLOWER = 22,
    BLOCK_BLUE_FLOWER = 23
};

// Chunk Coordinate
struct ChunkCoord {
    int p, q;
    bool operator==(const ChunkCoord& other) const {
        return p == other.p && q == other.q;
    }
    bool operator!=(const ChunkCoord& other) const {
        return !(*this == other);
    }
    bool operator<(const ChunkCoord& other) const {
        return std::tie(p, q) < std::tie(other.p, other.q);
    }
};

// Block position in world coordinates
struct BlockPos {
    int x, y, z;
    bool operator==(const BlockPos& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator<(const BlockPos& other) const {
        return std::tie(x, y, z) < std::tie(other.x, other.y, other.z);
    }
};

// Player pose: position plus two view angles
struct Transform {
    float x = 0.0f, y = 0.0f, z = 0.0f;
    float rx = 0.0f, ry = 0.0f;
    bool operator==(const Transform& other) const {
        return x == other.x && y == other.y && z == other.z && rx == other.rx && ry == other.ry;
    }
};

// Floor division of a block coordinate by the chunk size
inline int chunked(int v) {
    return static_cast<int>(std::floor(static_cast<double>(v) / CHUNK_SIZE));
}

inline ChunkCoord chunkOf(int x, int z) {
    return ChunkCoord{chunked(x), chunked(z)};
}

// Hash specialization for ChunkCoord
namespace std {
    template <>
    struct hash<ChunkCoord> {
        size_t operator()(const ChunkCoord& c) const {
            return (hash<int>()(c.p) * 31) ^ hash<int>()(c.q);
        }
    };
}

#endif // SHARED_TYPES_HPP
