#pragma once

#include <juce_core/juce_core.h>

namespace reflection {

// ============================================================
// Read-only projections of the dimension space into the ranges
// the renderer and synthesizer consume verbatim.
// ============================================================

struct VisualState {
    // Colors
    float colorHue1 = 0, colorHue2 = 0, colorHue3 = 0, colorHue4 = 0;
    float colorSaturation = 0, colorBrightness = 0, colorContrast = 0, colorWarmth = 0;

    // Gradient
    float gradientSpeed = 0, gradientScale = 0, gradientComplexity = 0;
    float gradientOffsetX = 0, gradientOffsetY = 0;
    float colorDropSpeed = 0, colorDropSpread = 0, colorMixIntensity = 0;

    // Displacement
    float displacementX = 0, displacementY = 0;
    float displacementStrength = 0, displacementRadius = 0;
    int   displacementRings = 0;
    float displacementRotation = 0, displacementWobble = 0, displacementChromatic = 0;
    float focusIntensity = 0;

    float rippleOrigin2X = 0, rippleOrigin2Y = 0, rippleOrigin2Strength = 0;
    float rippleOrigin3X = 0, rippleOrigin3Y = 0, rippleOrigin3Strength = 0;

    // Shape and wave
    float shapeType = 0;           // fractional, blends neighbouring modes
    float waveDelay = 0, waveAmplitude = 0, waveSpeed = 0;
    float edgeSharpness = 0, minRadius = 0, shapeRotation = 0, rotationSpeed = 0;
    float foldAmount = 0, invertAmount = 0;
    float secondaryWave = 0, tertiaryWave = 0;

    float morphProgress = 0;
    int   morphType = 0;

    // Post
    float blur = 0, glow = 0, vignette = 0, vignetteShape = 0.5f;
    float saturationPost = 0, brightnessPost = 0, contrastPost = 0, noiseAmount = 0;
    float brightnessEvolution = 0;

    // Particles / global
    float particleSpeed = 0, particleSize = 0;
    float overallIntensity = 0, breathingRate = 0, pulseRate = 0;

    juce::var toVar() const;
};

struct AudioState {
    // Normalized 0..1
    float audioVolume = 0, audioBass = 0, audioMid = 0, audioHigh = 0;
    float audioFilterBase = 0, audioFilterMid = 0, audioFilterHigh = 0;
    float audioReverb = 0, audioDelay = 0, audioModulation = 0, audioGrain = 0;

    // Physical units
    float droneBasePitch = 0, droneMidPitch = 0, droneHighPitch = 0;   // Hz
    float filterCutoff = 0;                                           // Hz
    float filterResonance = 0;                                        // Q
    float reverbAmount = 0, delayAmount = 0, chorusAmount = 0, granularDensity = 0;

    juce::var toVar() const;
};

} // namespace reflection
