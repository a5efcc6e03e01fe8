#ifndef PERLIN_NOISE_HPP
#define PERLIN_NOISE_HPP

#include <array>
#include <random>
#include <algorithm>
#include <cmath>

// Seeded 2D gradient noise with fractal octave summation
class PerlinNoise {
public:
    explicit PerlinNoise(unsigned int seed = 0) {
        for (int i = 0; i < 256; ++i) perm[i] = i;

        std::mt19937 engine(seed);
        std::shuffle(perm.begin(), perm.begin() + 256, engine);

        // Duplicate the permutation so corner lookups never wrap
        for (int i = 0; i < 256; ++i) perm[256 + i] = perm[i];
    }

    // Raw noise in roughly [-1, 1]
    double noise(double x, double y) const {
        int X = lattice(x);
        int Y = lattice(y);

        double fx = x - std::floor(x);
        double fy = y - std::floor(y);

        double u = fade(fx);
        double v = fade(fy);

        int A = perm[X] + Y;
        int B = perm[X + 1] + Y;

        double n00 = grad(perm[A], fx, fy);
        double n10 = grad(perm[B], fx - 1, fy);
        double n01 = grad(perm[A + 1], fx, fy - 1);
        double n11 = grad(perm[B + 1], fx - 1, fy - 1);

        return lerp(lerp(n00, n10, u), lerp(n01, n11, u), v);
    }

    // Octave sum normalised to [0, 1]
    double fractal(double x, double y, int octaves, double persistence, double lacunarity) const {
        double frequency = 1.0;
        double amplitude = 1.0;
        double total = 0.0;
        double maxAmplitude = 0.0;
        for (int i = 0; i < octaves; ++i) {
            total += noise(x * frequency, y * frequency) * amplitude;
            maxAmplitude += amplitude;
            amplitude *= persistence;
            frequency *= lacunarity;
        }
        double n = (total / maxAmplitude + 1.0) * 0.5;
        return std::clamp(n, 0.0, 1.0);
    }

private:
    std::array<int, 512> perm;

    // Eight unit gradient directions
    static constexpr double grad2[8][2] = {
        { 1.0,  0.0},  {-1.0,  0.0},  { 0.0,  1.0},  { 0.0, -1.0},
        { 0.70710678,  0.70710678},  {-0.70710678,  0.70710678},
        { 0.70710678, -0.70710678},  {-0.70710678, -0.70710678}
    };

    // floor(v) mod 256 without narrowing far coordinates to int first
    static inline int lattice(double v) {
        double cell = std::floor(v);
        return static_cast<int>(cell - 256.0 * std::floor(cell / 256.0)) & 255;
    }

    static inline double fade(double t) {
        return t * t * t * (t * (t * 6 - 15) + 10);
    }

    static inline double lerp(double a, double b, double t) {
        return a + t * (b - a);
    }

    static inline double grad(int hash, double x, double y) {
        const double *g = grad2[hash & 7];
        return g[0] * x + g[1] * y;
    }
};

#endif // PERLIN_NOISE_HPP
