#pragma once

namespace reflection {

// ============================================================
// FaceSmoother: turns jittery absolute face position into the
// slow push values (-1..1) fed to handleFacePositionSmooth.
// Spring-smoothed position, then a low-pass on the offsets.
// ============================================================
class FaceSmoother {
public:
    struct Push {
        float x = 0.0f;
        float y = 0.0f;
        float size = 0.0f;
    };

    // Face visible this frame; non-finite samples decay instead
    void track(float faceX, float faceY, float faceSize, float deltaTime);

    // No face: push values relax to zero, position recentres
    void decay(float deltaTime);

    const Push& push() const { return push_; }

private:
    struct Spring {
        float value;
        float velocity;
        float target;
    };

    static void stepSpring(Spring& s, float stiffness, float damping, float deltaTime);

    Spring x_    { 0.5f, 0.0f, 0.5f };
    Spring y_    { 0.5f, 0.0f, 0.5f };
    Spring size_ { 0.3f, 0.0f, 0.3f };
    Push push_;
};

} // namespace reflection
