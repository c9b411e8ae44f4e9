#pragma once

#include <string>

namespace reflection {

// ============================================================
// OverrideState: per-dimension arbitration between autonomous
// evolution and manual control.
//
// A lock is an indefinite pin stored beside the hold schedule,
// so unlocking leaves any pending hold/release untouched.
// Effective precedence: Locked > Held > Releasing > Free.
// ============================================================
class OverrideState {
public:
    enum class Mode { Free, Held, Releasing, Locked };

    // Effective mode at session time `now`
    Mode mode(double now) const;

    // 0 under lock/hold, eased floor..1 while releasing, 1 when free
    float autoFactor(double now, float easeFloor) const;

    // Value the dimension is pinned to (only meaningful when Locked/Held)
    float pinnedValue(double now) const;

    void lock(float value);
    void unlock();
    bool isLocked() const { return locked_; }

    // Hold exactly at `value` until now+holdSeconds, then ease back
    // over releaseSeconds.
    void engageHold(float value, double now, double holdSeconds, double releaseSeconds);

    // Retire a finished release window
    void settle(double now);

    bool isHeld(double now) const { return holdUntil_ > now; }
    double holdUntil() const { return holdUntil_; }
    double releaseStart() const { return releaseStart_; }
    double releaseDuration() const { return releaseDuration_; }

    static std::string modeToString(Mode m);

private:
    bool locked_ = false;
    float lockedValue_ = 0.5f;

    double holdUntil_ = 0.0;
    float holdValue_ = 0.5f;
    double releaseStart_ = 0.0;
    double releaseDuration_ = 0.0;
};

} // namespace reflection
