#include "FaceSmoother.h"
#include <cmath>

namespace reflection {

static constexpr float kRestSize = 0.3f;

void FaceSmoother::stepSpring(Spring& s, float stiffness, float damping, float deltaTime)
{
    float diff = s.target - s.value;
    s.velocity += diff * stiffness * deltaTime * 60.0f;
    s.velocity *= damping;
    s.value += s.velocity * deltaTime * 60.0f;
}

void FaceSmoother::track(float faceX, float faceY, float faceSize, float deltaTime)
{
    // A broken tracker frame counts as no face
    if (!std::isfinite(faceX) || !std::isfinite(faceY) || !std::isfinite(faceSize)
        || !std::isfinite(deltaTime)) {
        decay(deltaTime);
        return;
    }

    const float pushRate = 0.05f;

    x_.target = faceX;
    y_.target = faceY;
    size_.target = faceSize;

    stepSpring(x_, 0.8f, 0.92f, deltaTime);
    stepSpring(y_, 0.8f, 0.92f, deltaTime);
    stepSpring(size_, 0.8f, 0.92f, deltaTime);

    float xOffset = (x_.value - 0.5f) * 2.0f;
    float yOffset = (y_.value - 0.5f) * 2.0f;
    float sizeOffset = (size_.value - kRestSize) * 2.0f;

    push_.x += (xOffset - push_.x) * pushRate;
    push_.y += (yOffset - push_.y) * pushRate;
    push_.size += (sizeOffset - push_.size) * pushRate;
}

void FaceSmoother::decay(float deltaTime)
{
    if (!std::isfinite(deltaTime))
        deltaTime = 0.0f;

    const float decayRate = 0.02f;
    push_.x *= 1.0f - decayRate;
    push_.y *= 1.0f - decayRate;
    push_.size *= 1.0f - decayRate;

    x_.target = 0.5f;
    y_.target = 0.5f;
    size_.target = kRestSize;

    stepSpring(x_, 0.3f, 0.95f, deltaTime);
    stepSpring(y_, 0.3f, 0.95f, deltaTime);
    stepSpring(size_, 0.3f, 0.95f, deltaTime);
}

} // namespace reflection
