#include "FocusMode.h"
#include "../Model/EngineConfig.h"
#include <juce_core/juce_core.h>
#include <cmath>

namespace reflection {

void FocusMode::reset(SessionRandom& rng, const EngineConfig& cfg)
{
    active_ = false;
    intensity_ = 0.0f;
    targetIntensity_ = 0.0f;
    lastTransition_ = 0.0;
    nextTransition_ = rng.range(cfg.focusFirstMin, cfg.focusFirstMax);
}

void FocusMode::update(double now, SessionRandom& rng, const EngineConfig& cfg)
{
    if (now >= nextTransition_) {
        active_ = !active_;
        targetIntensity_ = active_ ? rng.range(0.6f, 1.0f) : 0.0f;
        lastTransition_ = now;
        float duration = active_ ? rng.range(cfg.focusActiveMin, cfg.focusActiveMax)
                                 : rng.range(cfg.focusIdleMin, cfg.focusIdleMax);
        nextTransition_ = now + duration;

        DBG("[focus] " << (active_ ? "activated" : "released")
            << ", intensity " << juce::String(targetIntensity_, 2)
            << ", next in " << juce::String(duration, 1) << "s");
    }

    float rate = active_ ? cfg.focusEnterRate : cfg.focusLeaveRate;
    intensity_ += (targetIntensity_ - intensity_) * rate;
}

void FocusMode::set(bool active, float intensity)
{
    if (!std::isfinite(intensity))
        return;

    active_ = active;
    targetIntensity_ = active ? juce::jlimit(0.0f, 1.0f, intensity) : 0.0f;
    DBG("[focus] manual " << (active ? "on" : "off") << " " << juce::String(targetIntensity_, 2));
}

} // namespace reflection
