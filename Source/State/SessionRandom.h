#pragma once

#include <cstdint>
#include <random>

namespace reflection {

// ============================================================
// SessionRandom: the single random source of an engine.
// One seed reproduces palette, mappings, connections, pendulum
// phase and every runtime spawn decision.
// ============================================================
class SessionRandom {
public:
    explicit SessionRandom(uint32_t seed) : seed_(seed), rng_(seed) {}

    static uint32_t platformSeed()
    {
        std::random_device rd;
        return rd();
    }

    uint32_t seed() const { return seed_; }

    // [0, 1)
    float uniform()
    {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        float v = dist(rng_);
        return v < 1.0f ? v : 0.0f;
    }

    float range(float lo, float hi) { return lo + uniform() * (hi - lo); }

    // [0, n)
    int index(int n)
    {
        if (n <= 1) return 0;
        std::uniform_int_distribution<int> dist(0, n - 1);
        return dist(rng_);
    }

    bool chance(float p) { return uniform() < p; }

    // -1 or +1
    float sign() { return uniform() > 0.5f ? 1.0f : -1.0f; }

private:
    uint32_t seed_;
    std::mt19937 rng_;
};

} // namespace reflection
