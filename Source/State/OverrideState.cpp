#include "OverrideState.h"
#include <algorithm>

namespace reflection {

static float smoothstep01(float t)
{
    t = std::max(0.0f, std::min(1.0f, t));
    return t * t * (3.0f - 2.0f * t);
}

OverrideState::Mode OverrideState::mode(double now) const
{
    if (locked_) return Mode::Locked;
    if (holdUntil_ > now) return Mode::Held;
    if (releaseDuration_ > 0.0 && now - releaseStart_ < releaseDuration_)
        return Mode::Releasing;
    return Mode::Free;
}

float OverrideState::autoFactor(double now, float easeFloor) const
{
    switch (mode(now)) {
        case Mode::Locked:
        case Mode::Held:
            return 0.0f;
        case Mode::Releasing: {
            double elapsed = now - releaseStart_;
            if (elapsed <= 0.0) return 0.0f;
            float t = (float)(elapsed / releaseDuration_);
            return easeFloor + (1.0f - easeFloor) * smoothstep01(t);
        }
        case Mode::Free:
            break;
    }
    return 1.0f;
}

float OverrideState::pinnedValue(double now) const
{
    if (locked_) return lockedValue_;
    if (holdUntil_ > now) return holdValue_;
    return lockedValue_;
}

void OverrideState::lock(float value)
{
    locked_ = true;
    lockedValue_ = value;
}

void OverrideState::unlock()
{
    locked_ = false;
}

void OverrideState::engageHold(float value, double now, double holdSeconds, double releaseSeconds)
{
    holdValue_ = value;
    holdUntil_ = now + std::max(0.0, holdSeconds);
    releaseStart_ = holdUntil_;
    releaseDuration_ = std::max(0.0, releaseSeconds);
}

void OverrideState::settle(double now)
{
    if (releaseDuration_ > 0.0 && holdUntil_ <= now && now - releaseStart_ >= releaseDuration_) {
        releaseStart_ = 0.0;
        releaseDuration_ = 0.0;
    }
}

std::string OverrideState::modeToString(Mode m)
{
    switch (m) {
        case Mode::Free:      return "free";
        case Mode::Held:      return "held";
        case Mode::Releasing: return "releasing";
        case Mode::Locked:    return "locked";
    }
    return "free";
}

} // namespace reflection
