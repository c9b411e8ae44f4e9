#pragma once

#include "Dimensions.h"
#include "SessionRandom.h"
#include <array>
#include <functional>
#include <vector>

namespace reflection {

struct EngineConfig;

// Slow eased migration of one dimension's target
struct ParameterShift {
    int dimension = 0;
    float startValue = 0.5f;
    float endValue = 0.5f;
    float duration = 1.0f;
    float elapsed = 0.0f;
    bool isFeedback = false;

    float progress() const;
    float valueAt() const;   // cosine-eased interpolation at current progress
};

// ============================================================
// ParameterShifts: bounded pool of concurrent shifts, spawned
// rarely on their own and more often after strong input.
// ============================================================
class ParameterShifts {
public:
    static constexpr int kMaxAttempts = 20;

    // Returns true if a dimension may not be picked (locked, held, static)
    using BlockedFn = std::function<bool(int)>;

    void reset(const EngineConfig& cfg);

    // Advance shifts and write their eased values into `target`.
    // Dimensions with autoFactor 0 keep their pinned target.
    void advance(float deltaTime,
                 std::array<float, kDimensionCount>& target,
                 const std::array<float, kDimensionCount>& autoFactors);

    // Regular and feedback-driven spawning for this frame
    void maybeSpawn(double now, SessionRandom& rng, const EngineConfig& cfg,
                    const std::array<float, kDimensionCount>& current,
                    const BlockedFn& isBlocked);

    // One spawn attempt; false if rejection sampling ran out of picks
    bool spawn(bool isFeedback, double now, SessionRandom& rng, const EngineConfig& cfg,
               const std::array<float, kDimensionCount>& current,
               const BlockedFn& isBlocked);

    // Keeps the max of current and new intensity
    void triggerFeedback(float intensity);

    const std::vector<ParameterShift>& active() const { return active_; }
    bool isShifting(int dimension) const;
    bool feedbackActive() const { return feedbackActive_; }
    float feedbackIntensity() const { return feedbackIntensity_; }
    double lastSpawnTime() const { return lastSpawnTime_; }
    float spawnInterval() const { return spawnInterval_; }

private:
    std::vector<ParameterShift> active_;
    double lastSpawnTime_ = 0.0;
    float spawnInterval_ = 10.0f;
    bool feedbackActive_ = false;
    float feedbackIntensity_ = 0.0f;
};

} // namespace reflection
