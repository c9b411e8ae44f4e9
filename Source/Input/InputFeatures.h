#pragma once

namespace reflection {

// ============================================================
// Feature records produced by the trackers (out of process
// scope). All scalars arrive pre-normalized.
// ============================================================

// Touch / pointer gesture frame
struct GestureData {
    bool isPinching = false;
    float pinchScale = 1.0f;       // <1 pinch in, >1 spread
    float pinchCenterX = 0.5f;     // 0..1
    float pinchCenterY = 0.5f;
    bool isRotating = false;
    float rotation = 0.0f;         // radians since last frame
    float swipeVelocityX = 0.0f;
    float swipeVelocityY = 0.0f;
};

// Face mesh features. Combined fields (eyesOpen, browRaise) are 0
// when the tracker only supplies the per-side values.
struct FaceFeatures {
    bool detected = false;

    float headYaw = 0.0f;          // -1..1
    float headPitch = 0.0f;
    float headRoll = 0.0f;

    float eyesOpen = 0.0f;         // 0..1
    float leftEyeOpen = 0.0f;
    float rightEyeOpen = 0.0f;

    float gazeX = 0.0f;            // -1..1
    float gazeY = 0.0f;

    float mouthOpen = 0.0f;        // 0..1
    float mouthWidth = 0.0f;

    float browRaise = 0.0f;
    float leftBrowRaise = 0.0f;
    float rightBrowRaise = 0.0f;
    float browFurrow = 0.0f;

    float lookingAtScreen = 0.5f;  // 0..1
    float engagement = 0.5f;
};

} // namespace reflection
