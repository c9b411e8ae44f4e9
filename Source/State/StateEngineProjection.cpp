#include "StateEngine.h"
#include <algorithm>
#include <cmath>

namespace reflection {

static constexpr float kTwoPi = 6.28318530717959f;

// Secondary ripple origins orbit the primary displacement center
float StateEngine::orbitX(int index, float radius) const
{
    float speed = 0.03f / (float)index;
    float phase = (float)index * 3.14159265358979f * 0.667f;
    float offset = std::cos((float)time_ * speed + phase) * radius * 0.5f;
    return std::max(0.0f, std::min(1.0f, cur(Dim::DisplacementX) + offset));
}

float StateEngine::orbitY(int index, float radius) const
{
    float speed = 0.03f / (float)index;
    float phase = (float)index * 3.14159265358979f * 0.667f;
    float offset = std::sin((float)time_ * speed + phase) * radius * 0.5f;
    return std::max(0.0f, std::min(1.0f, cur(Dim::DisplacementY) + offset));
}

VisualState StateEngine::getVisualState() const
{
    const float focus = focus_.intensity();
    VisualState v;

    v.colorHue1 = cur(Dim::ColorHue1);
    v.colorHue2 = cur(Dim::ColorHue2);
    v.colorHue3 = cur(Dim::ColorHue3);
    v.colorHue4 = cur(Dim::ColorHue4);
    v.colorSaturation = scaled(Dim::ColorSaturation, 0.5f, 1.0f);
    v.colorBrightness = scaled(Dim::ColorBrightness, 0.45f, 0.95f);
    v.colorContrast = scaled(Dim::ColorContrast, 0.9f, 1.2f);
    v.colorWarmth = cur(Dim::ColorWarmth);

    v.gradientSpeed = scaled(Dim::GradientSpeed, 0.0001f, 0.0006f);
    v.gradientScale = scaled(Dim::GradientScale, 0.3f, 1.2f);
    v.gradientComplexity = scaled(Dim::GradientComplexity, 2.5f, 5.5f);
    v.gradientOffsetX = scaled(Dim::GradientOffsetX, -0.4f, 0.4f);
    v.gradientOffsetY = scaled(Dim::GradientOffsetY, -0.4f, 0.4f);

    v.colorDropSpeed = scaled(Dim::OverallSpeed, 0.02f, 0.08f);
    v.colorDropSpread = scaled(Dim::OverallChaos, 0.3f, 0.8f);
    v.colorMixIntensity = scaled(Dim::OverallIntensity, 0.4f, 0.9f);

    // Focus mode gives a smaller, more intense portal
    v.displacementX = cur(Dim::DisplacementX);
    v.displacementY = cur(Dim::DisplacementY);
    v.displacementStrength = scaled(Dim::DisplacementStrength, 1.0f, 3.0f) * (1.0f + focus * 0.7f);
    v.displacementRadius = scaled(Dim::DisplacementRadius, 0.5f, 2.2f) * (1.0f - focus * 0.4f);
    v.displacementRings = (int)std::floor(scaled(Dim::DisplacementRings, 4.0f, 14.0f));
    v.displacementRotation = cur(Dim::DisplacementRotation) * kTwoPi;
    v.displacementWobble = scaled(Dim::DisplacementWobble, 0.02f, 0.18f);
    v.displacementChromatic = scaled(Dim::DisplacementChromatic, 0.05f, 0.35f) * (1.0f + focus * 0.5f);
    v.focusIntensity = focus;

    v.rippleOrigin2X = orbitX(2, 0.25f);
    v.rippleOrigin2Y = orbitY(2, 0.25f);
    v.rippleOrigin2Strength = scaled(Dim::RippleOrigin2Strength, 0.2f, 0.6f);
    v.rippleOrigin3X = orbitX(3, 0.35f);
    v.rippleOrigin3Y = orbitY(3, 0.35f);
    v.rippleOrigin3Strength = scaled(Dim::RippleOrigin3Strength, 0.1f, 0.4f);

    v.shapeType = scaled(Dim::ShapeType, 0.0f, 12.0f);
    v.waveDelay = scaled(Dim::WaveDelay, 0.3f, 1.2f);
    v.waveAmplitude = scaled(Dim::WaveAmplitude, 0.03f, 0.15f);
    v.waveSpeed = scaled(Dim::WaveSpeed, 0.1f, 0.6f);
    v.edgeSharpness = scaled(Dim::EdgeSharpness, 0.01f, 0.08f);
    v.minRadius = scaled(Dim::MinRadius, 0.0f, 0.35f);
    v.shapeRotation = scaled(Dim::ShapeRotation, 0.0f, 6.28f);
    v.rotationSpeed = scaled(Dim::RotationSpeed, 0.0f, 0.4f);

    // Aliased cells: these share storage with mood controls
    v.foldAmount = scaled(Dim::OverallChaos, 0.0f, 1.0f);
    v.invertAmount = scaled(Dim::OverallWarmth, 0.0f, 1.0f);
    v.secondaryWave = scaled(Dim::OverallIntensity, 0.0f, 0.5f);
    v.tertiaryWave = scaled(Dim::OverallSpeed, 0.0f, 0.3f);

    v.morphProgress = cur(Dim::MorphProgress);
    v.morphType = (int)std::floor(cur(Dim::MorphType) * 3.0f);

    v.blur = scaled(Dim::Blur, 0.0f, 0.35f);
    v.glow = scaled(Dim::Glow, 0.1f, 0.5f);
    v.vignette = scaled(Dim::Vignette, 0.0f, 1.0f);
    v.vignetteShape = 0.5f;
    v.saturationPost = scaled(Dim::SaturationPost, 0.9f, 1.3f);
    v.brightnessPost = scaled(Dim::BrightnessPost, 0.85f, 1.15f);
    v.contrastPost = scaled(Dim::ContrastPost, 0.95f, 1.15f);
    v.noiseAmount = scaled(Dim::NoiseAmount, 0.0f, 0.015f);
    v.brightnessEvolution = scaled(Dim::BrightnessEvolution, 0.2f, 1.5f);

    v.particleSpeed = scaled(Dim::WaveDelay, 0.005f, 0.03f);
    v.particleSize = scaled(Dim::WaveAmplitude, 0.5f, 1.5f);

    v.overallIntensity = cur(Dim::OverallIntensity);
    v.breathingRate = scaled(Dim::WaveSpeed, 0.02f, 0.08f);
    v.pulseRate = scaled(Dim::EdgeSharpness, 0.03f, 0.12f);
    return v;
}

AudioState StateEngine::getAudioState() const
{
    AudioState a;
    a.audioVolume = cur(Dim::OverallIntensity);
    a.audioBass = cur(Dim::DroneBaseVolume);
    a.audioMid = cur(Dim::DroneMidVolume);
    a.audioHigh = cur(Dim::DroneHighVolume);

    a.audioFilterBase = cur(Dim::FilterCutoff);
    a.audioFilterMid = cur(Dim::FilterResonance);
    a.audioFilterHigh = cur(Dim::ColorBrightness);

    a.audioReverb = cur(Dim::ReverbAmount);
    a.audioDelay = cur(Dim::DelayAmount);
    a.audioModulation = cur(Dim::ChorusAmount);
    a.audioGrain = cur(Dim::GranularDensity);

    a.droneBasePitch = scaled(Dim::DroneBasePitch, 40.0f, 80.0f);
    a.droneMidPitch = scaled(Dim::DroneMidPitch, 80.0f, 200.0f);
    a.droneHighPitch = scaled(Dim::DroneHighPitch, 300.0f, 600.0f);
    a.filterCutoff = scaled(Dim::FilterCutoff, 100.0f, 4000.0f);
    a.filterResonance = scaled(Dim::FilterResonance, 0.5f, 8.0f);
    a.reverbAmount = scaled(Dim::ReverbAmount, 0.2f, 0.8f);
    a.delayAmount = scaled(Dim::DelayAmount, 0.1f, 0.5f);
    a.chorusAmount = scaled(Dim::ChorusAmount, 0.1f, 0.4f);
    a.granularDensity = scaled(Dim::GranularDensity, 0.1f, 0.8f);
    return a;
}

} // namespace reflection
