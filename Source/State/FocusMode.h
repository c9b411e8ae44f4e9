#pragma once

#include "SessionRandom.h"

namespace reflection {

struct EngineConfig;

// ============================================================
// FocusMode: session-wide "zoom in" multiplier that flips
// between active and idle on a randomized schedule.
// ============================================================
class FocusMode {
public:
    void reset(SessionRandom& rng, const EngineConfig& cfg);

    // Toggle when `now` passes the scheduled transition, then ease
    // intensity toward its target.
    void update(double now, SessionRandom& rng, const EngineConfig& cfg);

    // Manual trigger; the automatic schedule is left alone.
    // Intensity is clamped to [0, 1]; non-finite values are ignored.
    void set(bool active, float intensity);

    bool isActive() const { return active_; }
    float intensity() const { return intensity_; }
    float targetIntensity() const { return targetIntensity_; }
    double nextTransition() const { return nextTransition_; }
    double lastTransition() const { return lastTransition_; }

private:
    bool active_ = false;
    float intensity_ = 0.0f;
    float targetIntensity_ = 0.0f;
    double nextTransition_ = 0.0;
    double lastTransition_ = 0.0;
};

} // namespace reflection
