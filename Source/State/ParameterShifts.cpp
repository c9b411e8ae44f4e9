#include "ParameterShifts.h"
#include "../Model/EngineConfig.h"
#include <juce_core/juce_core.h>
#include <algorithm>
#include <cmath>

namespace reflection {

float ParameterShift::progress() const
{
    if (duration <= 0.0f) return 1.0f;
    return std::min(1.0f, elapsed / duration);
}

float ParameterShift::valueAt() const
{
    float eased = 0.5f - std::cos(progress() * 3.14159265358979f) * 0.5f;
    return startValue + (endValue - startValue) * eased;
}

void ParameterShifts::reset(const EngineConfig& cfg)
{
    active_.clear();
    lastSpawnTime_ = 0.0;
    spawnInterval_ = cfg.initialSpawnInterval;
    feedbackActive_ = false;
    feedbackIntensity_ = 0.0f;
}

void ParameterShifts::advance(float deltaTime,
                              std::array<float, kDimensionCount>& target,
                              const std::array<float, kDimensionCount>& autoFactors)
{
    for (auto it = active_.begin(); it != active_.end();) {
        it->elapsed += deltaTime;
        if (autoFactors[(size_t)it->dimension] > 0.0f)
            target[(size_t)it->dimension] = it->valueAt();

        if (it->progress() >= 1.0f)
            it = active_.erase(it);
        else
            ++it;
    }
}

void ParameterShifts::maybeSpawn(double now, SessionRandom& rng, const EngineConfig& cfg,
                                 const std::array<float, kDimensionCount>& current,
                                 const BlockedFn& isBlocked)
{
    double sinceSpawn = now - lastSpawnTime_;
    if ((int)active_.size() < cfg.maxActiveShifts
        && sinceSpawn > spawnInterval_
        && rng.chance(cfg.shiftSpawnChance))
        spawn(false, now, rng, cfg, current, isBlocked);

    if (feedbackActive_ && feedbackIntensity_ > cfg.feedbackThreshold) {
        int extra = (int)std::floor(feedbackIntensity_ * 3.0f);
        for (int i = 0; i < extra && (int)active_.size() < cfg.maxActiveShifts; ++i) {
            if (rng.chance(cfg.feedbackSpawnChance))
                spawn(true, now, rng, cfg, current, isBlocked);
        }
        feedbackIntensity_ *= cfg.feedbackDecay;
    }
}

bool ParameterShifts::spawn(bool isFeedback, double now, SessionRandom& rng, const EngineConfig& cfg,
                            const std::array<float, kDimensionCount>& current,
                            const BlockedFn& isBlocked)
{
    const int audioFirst = indexOf(Dim::DroneBasePitch);
    const int audioCount = 12;
    bool pickAudio = rng.chance(cfg.audioShiftBias);

    int dim = kInvalidDimension;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        int candidate = pickAudio ? audioFirst + rng.index(audioCount)
                                  : rng.index(kDimensionCount);
        if (isShifting(candidate) || (isBlocked && isBlocked(candidate)))
            continue;
        dim = candidate;
        break;
    }

    if (dim == kInvalidDimension)
        return false;

    float startValue = current[(size_t)dim];
    float amount = (rng.uniform() - 0.5f) * (isFeedback ? 0.15f : 0.08f);
    float endValue = startValue + amount;
    if (!isHueDimension(dim))
        endValue = std::max(0.25f, std::min(0.75f, endValue));

    float duration = isFeedback ? rng.range(10.0f, 30.0f) : rng.range(25.0f, 70.0f);

    ParameterShift s;
    s.dimension = dim;
    s.startValue = startValue;
    s.endValue = endValue;
    s.duration = duration;
    s.isFeedback = isFeedback;
    active_.push_back(s);

    lastSpawnTime_ = now;
    spawnInterval_ = rng.range(10.0f, 60.0f);

    DBG("[shift] " << juce::String(Dimensions::nameOf(dim)) << ": "
        << juce::String(startValue, 3) << " -> " << juce::String(endValue, 3)
        << " over " << juce::String(duration, 1) << "s"
        << (isFeedback ? " (feedback)" : ""));
    return true;
}

void ParameterShifts::triggerFeedback(float intensity)
{
    feedbackActive_ = true;
    feedbackIntensity_ = std::max(feedbackIntensity_, intensity);
}

bool ParameterShifts::isShifting(int dimension) const
{
    for (auto& s : active_)
        if (s.dimension == dimension) return true;
    return false;
}

} // namespace reflection
