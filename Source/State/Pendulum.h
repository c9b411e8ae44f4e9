#pragma once

#include "SessionRandom.h"

namespace reflection {

struct EngineConfig;

struct PendulumAxis {
    float angle = 0.0f;
    float velocity = 0.0f;
};

// ============================================================
// Pendulum: four heavily damped scalar oscillators producing
// slow camera-like sway. Rubber band beyond +/-0.8 rad, never
// a hard stop.
// ============================================================
class Pendulum {
public:
    static constexpr float kMaxSwing = 0.8f;
    static constexpr float kMaxVelocity = 0.001f;
    static constexpr float kMaxStep = 0.05f;

    void randomize(SessionRandom& rng);

    // dt is capped at kMaxStep
    void step(float deltaTime, double time, const EngineConfig& cfg);

    // Projected positions blended into the dimension space
    float offsetX() const;
    float offsetY() const;
    float rotation() const;
    float scale() const;

    PendulumAxis x, y, rot, zoom;

private:
    static void stepAxis(PendulumAxis& p, float dt, double time, const EngineConfig& cfg);
};

} // namespace reflection
