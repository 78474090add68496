#pragma once

#include <cstdint>
#include <random>

namespace ghostwatch {

/// Seedable random source shared by the simulation. A fixed seed makes
/// spawn positions and velocity re-rolls reproducible.
class Random {
public:
    Random() : m_rng(std::random_device{}()) {}
    explicit Random(uint32_t seed) : m_rng(seed) {}

    void seed(uint32_t seed) { m_rng.seed(seed); }

    /// Uniform float in [min, max).
    float uniform(float min, float max);

    /// Uniform integer in [min, max], both ends inclusive.
    int uniformInt(int min, int max);

    /// True with probability `p`.
    bool chance(float p);

private:
    std::mt19937 m_rng;
};

} // namespace ghostwatch
