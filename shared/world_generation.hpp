#ifndef WORLD_GENERATION_HPP
#define WORLD_GENERATION_HPP

#include <algorithm>
#include <cmath>

#include "config.hpp"
#include "types.hpp"
#include "chunk.hpp"
#include "perlin_noise.hpp"

// Tree Generation Constants
constexpr int TREE_CANOPY_RADIUS = 3;
constexpr int TREE_TRUNK_HEIGHT = 7;
constexpr double TREE_CHANCE_THRESHOLD = 0.74;

// Default terrain: rolling grass hills, sand flats at water level, plants and trees.
// Generation is a pure function of (seed, p, q) so a chunk with no stored record
// always regenerates identically.
class TerrainGenerator {
public:
    explicit TerrainGenerator(unsigned int seed = PERLIN_SEED) : perlin(seed) {}

    int columnHeight(int x, int z, bool* isSand = nullptr) const {
        double f = perlin.fractal(x * 0.01, z * 0.01, 4, 0.5, 2.0);
        double g = perlin.fractal(-static_cast<double>(x) * 0.01 + 100.0,
                                  -static_cast<double>(z) * 0.01 + 100.0, 2, 0.9, 2.0);
        int mh = static_cast<int>(g * TERRAIN_HEIGHT_RANGE) + TERRAIN_BASE_HEIGHT;
        int h = static_cast<int>(f * mh);
        bool sand = false;
        if (h <= WATER_LEVEL) {
            h = WATER_LEVEL;
            sand = true;
        }
        if (isSand) *isSand = sand;
        return h;
    }

    void generate(Chunk& chunk) const {
        const ChunkCoord c = chunk.coord();
        const int baseX = c.p * CHUNK_SIZE;
        const int baseZ = c.q * CHUNK_SIZE;

        for (int dx = 0; dx < CHUNK_SIZE; ++dx) {
            for (int dz = 0; dz < CHUNK_SIZE; ++dz) {
                int x = baseX + dx;
                int z = baseZ + dz;
                bool sand = false;
                int h = columnHeight(x, z, &sand);
                int surface = sand ? BLOCK_SAND : BLOCK_GRASS;

                for (int y = 0; y < h; ++y) {
                    chunk.fill(x, y, z, surface);
                }
                if (sand) continue;

                generatePlant(chunk, x, h, z);

                // Trees only where the whole canopy fits inside this chunk
                bool fits = dx - TREE_CANOPY_RADIUS - 1 >= 0 && dz - TREE_CANOPY_RADIUS - 1 >= 0 &&
                            dx + TREE_CANOPY_RADIUS + 1 < CHUNK_SIZE && dz + TREE_CANOPY_RADIUS + 1 < CHUNK_SIZE;
                if (fits && perlin.fractal(x * 0.93 + 0.37, z * 0.93 + 0.71, 6, 0.5, 2.0) > TREE_CHANCE_THRESHOLD) {
                    generateTree(chunk, x, h, z);
                }
            }
        }
    }

private:
    PerlinNoise perlin;

    void generatePlant(Chunk& chunk, int x, int h, int z) const {
        if (perlin.fractal(-static_cast<double>(x) * 0.1 + 0.5, z * 0.1 + 0.5, 4, 0.8, 2.0) > 0.6) {
            chunk.fill(x, h, z, BLOCK_TALL_GRASS);
        }
        if (perlin.fractal(x * 0.05 + 0.5, -static_cast<double>(z) * 0.05 + 0.5, 4, 0.8, 2.0) > 0.7) {
            double pick = perlin.fractal(x * 0.1 + 0.25, z * 0.1 + 0.25, 4, 0.8, 2.0);
            int w = BLOCK_YELLOW_FLOWER + std::min(5, static_cast<int>(pick * 6));
            chunk.fill(x, h, z, w);
        }
    }

    void generateTree(Chunk& chunk, int x, int h, int z) const {
        for (int y = h + 3; y < h + 8; ++y) {
            for (int ox = -TREE_CANOPY_RADIUS; ox <= TREE_CANOPY_RADIUS; ++ox) {
                for (int oz = -TREE_CANOPY_RADIUS; oz <= TREE_CANOPY_RADIUS; ++oz) {
                    int dy = y - (h + 4);
                    if (ox * ox + oz * oz + dy * dy < 11) {
                        chunk.fill(x + ox, y, z + oz, BLOCK_LEAVES);
                    }
                }
            }
        }
        for (int y = h; y < h + TREE_TRUNK_HEIGHT; ++y) {
            chunk.fill(x, y, z, BLOCK_WOOD);
        }
    }
};

#endif // WORLD_GENERATION_HPP
