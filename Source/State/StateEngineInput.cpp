#include "StateEngine.h"
#include <cmath>

// ============================================================
// StateEngine input handlers
//
// Every modality lands in the influence accumulator, never in
// current/target, so all input shares the decay and damped
// integration of update().
// ============================================================

namespace reflection {

void StateEngine::bump(Dim d, float amount)
{
    bump(indexOf(d), amount);
}

void StateEngine::bump(int index, float amount)
{
    if (index < 0 || index >= kDimensionCount || !std::isfinite(amount))
        return;
    influence_[(size_t)index] += amount;
}

void StateEngine::addInfluence(const std::string& name, float amount)
{
    bump(Dimensions::find(name), amount);
}

void StateEngine::handleKeyPress(char key)
{
    auto* mapping = keyMappings_.find(key);
    if (mapping == nullptr)
        return;

    for (auto& k : *mapping)
        bump(k.dimension, k.strength * 0.5f);
}

void StateEngine::handleMouseMove(float x, float y)
{
    bump(Dim::DisplacementX, (x - 0.5f) * 0.01f);
    bump(Dim::DisplacementY, (y - 0.5f) * 0.01f);

    bump(Dim::ColorHue1, (x - 0.5f) * 0.005f);
    bump(Dim::ColorWarmth, (y - 0.5f) * 0.005f);
}

void StateEngine::handleGestureInput(const GestureData& g)
{
    // Pinch: scale < 1 tightens and strengthens the portal
    if (g.isPinching) {
        bump(Dim::DisplacementRadius, (g.pinchScale - 1.0f) * 0.1f);
        bump(Dim::DisplacementStrength, (1.0f - g.pinchScale) * 0.05f);
        bump(Dim::DisplacementX, (g.pinchCenterX - 0.5f) * 0.02f);
        bump(Dim::DisplacementY, (g.pinchCenterY - 0.5f) * 0.02f);
    }

    if (g.isRotating)
        bump(Dim::ShapeRotation, g.rotation * 0.3f);

    if (std::abs(g.swipeVelocityX) > 0.01f || std::abs(g.swipeVelocityY) > 0.01f) {
        bump(Dim::GradientOffsetX, g.swipeVelocityX * 0.2f);
        bump(Dim::GradientOffsetY, g.swipeVelocityY * 0.2f);

        float speed = std::sqrt(g.swipeVelocityX * g.swipeVelocityX
                              + g.swipeVelocityY * g.swipeVelocityY);
        bump(Dim::ColorHue1, speed * 0.5f);
        bump(Dim::OverallIntensity, speed * 0.1f);
    }
}

void StateEngine::handleAudioInput(float volume, float bass, float mid, float treble)
{
    if (!std::isfinite(volume) || !std::isfinite(bass) || !std::isfinite(mid) || !std::isfinite(treble))
        return;

    const float s = 0.15f;

    bump(Dim::OverallIntensity, volume * s * 0.8f);
    bump(Dim::OverallChaos, volume * s * 0.3f);

    bump(Dim::DisplacementStrength, bass * s * 0.6f);
    bump(Dim::DroneBaseVolume, bass * s * 0.4f);
    bump(Dim::DisplacementRadius, bass * s * 0.3f);

    bump(Dim::FilterCutoff, mid * s * 0.5f);
    bump(Dim::GranularDensity, mid * s * 0.4f);
    bump(Dim::DroneMidVolume, mid * s * 0.3f);

    bump(Dim::Glow, treble * s * 0.5f);
    bump(Dim::DroneHighVolume, treble * s * 0.4f);

    bump(Dim::ColorVibrance, volume * s * 0.2f);

    bump(Dim::ReverbAmount, volume * s * 0.25f);
    bump(Dim::DelayAmount, mid * s * 0.2f + treble * s * 0.1f);
    bump(Dim::ChorusAmount, treble * s * 0.15f);

    float audioIntensity = (volume + bass * 1.5f + mid + treble * 0.5f) / 4.0f;
    if (audioIntensity > 0.2f)
        triggerInputFeedback(audioIntensity);
}

void StateEngine::handleFacePosition(float x, float y, float size)
{
    bump(Dim::DisplacementX, (x - cur(Dim::DisplacementX)) * 0.05f);
    bump(Dim::DisplacementY, (y - cur(Dim::DisplacementY)) * 0.05f);
    bump(Dim::DisplacementRadius, (size - cur(Dim::DisplacementRadius)) * 0.05f);
}

void StateEngine::handleFacePositionSmooth(float pushX, float pushY, float pushSize)
{
    const float p = 0.18f;

    bump(Dim::DisplacementX, pushX * p * 1.5f);
    bump(Dim::Glow, -pushY * p * 0.4f);
    bump(Dim::DisplacementY, pushY * p * 1.2f);

    // Closer face: tighter, more intense
    bump(Dim::DisplacementStrength, pushSize * p * 0.5f);
    bump(Dim::DisplacementRadius, -pushSize * p * 0.4f);
    bump(Dim::OverallIntensity, pushSize * p * 0.4f);
    bump(Dim::DisplacementChromatic, pushSize * p * 0.3f);

    bump(Dim::ShapeRotation, pushX * p * 0.2f);

    // Audio side
    bump(Dim::FilterCutoff, -pushY * p * 0.4f);
    bump(Dim::ReverbAmount, -pushSize * p * 0.3f);
    bump(Dim::GranularDensity, pushSize * p * 0.35f);
    bump(Dim::DelayAmount, std::abs(pushX) * p * 0.2f);
    bump(Dim::ChorusAmount, std::abs(pushX) * p * 0.15f);
    bump(Dim::DroneBaseVolume, pushSize * p * 0.25f);
    bump(Dim::DroneMidVolume, pushSize * p * 0.2f);
    bump(Dim::DroneHighVolume, -pushY * p * 0.2f);
}

void StateEngine::handleFaceFeatures(const FaceFeatures& f)
{
    if (!f.detected)
        return;

    const float str = 0.1f;

    // Head rotation
    bump(Dim::DisplacementX, f.headYaw * str * 1.9f);
    bump(Dim::ShapeRotation, f.headYaw * str * 0.5f);

    bump(Dim::DisplacementY, f.headPitch * str * 1.5f);
    bump(Dim::Glow, -f.headPitch * str * 0.7f);
    bump(Dim::FilterCutoff, -f.headPitch * str * 0.9f);

    bump(Dim::ShapeRotation, f.headRoll * str * 0.8f);
    bump(Dim::DisplacementRotation, f.headRoll * str * 0.6f);

    // Eyes
    float eyes = f.eyesOpen > 0.0f ? f.eyesOpen : (f.leftEyeOpen + f.rightEyeOpen) * 0.5f;
    bump(Dim::OverallIntensity, (eyes - 0.5f) * str * 1.2f);
    bump(Dim::DisplacementStrength, (eyes - 0.5f) * str * 1.0f);

    float wink = f.leftEyeOpen - f.rightEyeOpen;
    bump(Dim::DisplacementX, wink * str * 0.8f);
    bump(Dim::GradientOffsetX, wink * str * 0.6f);

    // Gaze
    bump(Dim::DisplacementX, f.gazeX * str * 1.2f);
    bump(Dim::DisplacementY, f.gazeY * str * 1.0f);

    // Mouth
    bump(Dim::OverallChaos, f.mouthOpen * str * 1.5f);
    bump(Dim::GranularDensity, f.mouthOpen * str * 1.2f);
    bump(Dim::ReverbAmount, f.mouthOpen * str * 0.8f);
    bump(Dim::DisplacementStrength, f.mouthOpen * str * 0.8f);

    bump(Dim::DroneHighVolume, f.mouthWidth * str * 0.6f);
    bump(Dim::Glow, f.mouthWidth * str * 0.5f);

    // Brows
    float brow = f.browRaise > 0.0f ? f.browRaise : (f.leftBrowRaise + f.rightBrowRaise) * 0.5f;
    bump(Dim::DisplacementRadius, brow * str * 1.2f);
    bump(Dim::Glow, brow * str * 0.8f);
    bump(Dim::OverallIntensity, brow * str * 0.6f);

    bump(Dim::DroneBaseVolume, f.browFurrow * str * 0.8f);
    bump(Dim::DisplacementStrength, f.browFurrow * str * 0.8f);
    bump(Dim::FilterResonance, f.browFurrow * str * 0.5f);

    // Attention
    bump(Dim::OverallChaos, -(f.lookingAtScreen - 0.5f) * str * 0.8f);
    bump(Dim::OverallIntensity, (f.engagement - 0.5f) * str * 0.8f);
}

void StateEngine::handleBlink()
{
    bump(Dim::Glow, 0.25f);
    bump(Dim::DisplacementStrength, 0.15f);
    bump(Dim::OverallIntensity, 0.12f);
}

void StateEngine::handleTalking(bool isTalking)
{
    if (!isTalking)
        return;
    bump(Dim::OverallChaos, 0.02f);
    bump(Dim::GranularDensity, 0.015f);
}

void StateEngine::handleMotion(float tiltX, float tiltY, float shake)
{
    bump(Dim::GradientOffsetX, tiltX * 0.05f);
    bump(Dim::GradientOffsetY, tiltY * 0.05f);
    bump(Dim::OverallChaos, shake * 0.1f);
}

void StateEngine::triggerInputFeedback(float intensity)
{
    if (!std::isfinite(intensity))
        return;
    shifts_.triggerFeedback(intensity);
}

} // namespace reflection
