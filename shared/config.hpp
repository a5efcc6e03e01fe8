// shared/config.hpp
// World and protocol constants shared by server and clients
#ifndef SHARED_CONFIG_HPP
#define SHARED_CONFIG_HPP

#include <cstdint>

// World Dimensions
// Chunks are full-height columns keyed by (p, q)
constexpr int CHUNK_SIZE = 32;

// Default vertical bounds for block edits (y = 0 is bedrock)
constexpr int DEFAULT_MIN_Y = 1;
constexpr int DEFAULT_MAX_Y = 255;

// Material ids
constexpr int MATERIAL_AIR = 0;
constexpr int MAX_MATERIAL_ID = 255;

// The world spawn position
constexpr float SPAWN_X = 0.0f;
constexpr float SPAWN_Z = 0.0f;
constexpr float SPAWN_HEADROOM = 2.0f;

// Perlin Terrain Generation
constexpr unsigned int PERLIN_SEED = 42;
constexpr int WATER_LEVEL = 12;       // Columns at or below are flattened to sand
constexpr int TERRAIN_BASE_HEIGHT = 16;
constexpr int TERRAIN_HEIGHT_RANGE = 32;

// Day/night cycle length sent in the time record (seconds)
constexpr int DAY_LENGTH = 600;

// Networking
constexpr unsigned short DEFAULT_PORT = 4080;
constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 1024;
constexpr std::size_t DEFAULT_MAX_OUTBOUND_BYTES = 32 * 1024 * 1024;

#endif // SHARED_CONFIG_HPP
