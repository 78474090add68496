#include "engine/Random.hpp"

namespace ghostwatch {

float Random::uniform(float min, float max) {
    std::uniform_real_distribution<float> dist(min, max);
    float value = dist(m_rng);
    // Float rounding inside the distribution can land exactly on max
    return value < max ? value : min;
}

int Random::uniformInt(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(m_rng);
}

bool Random::chance(float p) {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(m_rng) < p;
}

} // namespace ghostwatch
