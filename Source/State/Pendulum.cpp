#include "Pendulum.h"
#include "../Model/EngineConfig.h"
#include <algorithm>
#include <cmath>

namespace reflection {

static constexpr float kPi = 3.14159265358979f;

void Pendulum::randomize(SessionRandom& rng)
{
    x.angle = (rng.uniform() - 0.5f) * kPi * 0.8f;
    x.velocity = (rng.uniform() - 0.5f) * 0.0004f;
    y.angle = (rng.uniform() - 0.5f) * kPi * 0.8f;
    y.velocity = (rng.uniform() - 0.5f) * 0.0004f;
    rot.angle = (rng.uniform() - 0.5f) * kPi * 0.4f;
    rot.velocity = (rng.uniform() - 0.5f) * 0.0002f;
    zoom.angle = rng.uniform() * kPi;
    zoom.velocity = 0.0f;
}

void Pendulum::step(float deltaTime, double time, const EngineConfig& cfg)
{
    float dt = std::min(deltaTime, kMaxStep);
    stepAxis(x, dt, time, cfg);
    stepAxis(y, dt, time, cfg);
    stepAxis(rot, dt, time, cfg);
    stepAxis(zoom, dt, time, cfg);
}

void Pendulum::stepAxis(PendulumAxis& p, float dt, double time, const EngineConfig& cfg)
{
    float t = (float)time;

    // Wind: three incommensurate sinusoids
    float drift = (std::sin(t * 0.015f + p.angle * 1.7f) * 0.4f
                 + std::sin(t * 0.011f + p.angle * 0.8f) * 0.35f
                 + std::sin(t * 0.008f) * 0.25f) * cfg.pendulumDriftForce * 0.3f;

    float spring = -std::sin(p.angle) * cfg.pendulumStiffness * 0.3f;

    float mag = std::abs(p.angle);
    if (mag > kMaxSwing) {
        float overshoot = mag - kMaxSwing;
        float rubber = (p.angle > 0.0f ? -1.0f : 1.0f) * overshoot * 0.00005f;
        p.velocity += rubber * dt * 60.0f;
    }

    p.velocity += (drift + spring) * dt * 60.0f;
    p.velocity *= std::pow(cfg.pendulumDamping * 0.99f, dt * 60.0f);
    p.velocity = std::max(-kMaxVelocity, std::min(kMaxVelocity, p.velocity));
    p.angle += p.velocity * dt * 60.0f;
}

float Pendulum::offsetX() const { return 0.5f + std::sin(x.angle) * 0.05f; }
float Pendulum::offsetY() const { return 0.5f + std::sin(y.angle) * 0.04f; }
float Pendulum::rotation() const { return std::sin(rot.angle) * 0.03f; }
float Pendulum::scale() const { return 0.5f + std::sin(zoom.angle) * 0.02f; }

} // namespace reflection
