#pragma once

#include <juce_core/juce_core.h>
#include <cstdint>

namespace reflection {

// ============================================================
// EngineConfig: tuning constants for the state engine.
// Defaults reproduce the installation's calm, glacial motion.
// JSON keys are snake_case, grouped by subsystem.
// ============================================================
struct EngineConfig {
    uint32_t seed = 0;               // 0 = seed from the platform random source

    // Smoothing integration
    float momentum          = 0.998f;
    float acceleration      = 0.08f;
    float velocityCap       = 0.0008f;
    float elasticMargin     = 0.15f;
    float elasticity        = 0.0003f;
    float influenceDecay    = 0.98f;   // per 1/60 s
    float influenceEpsilon  = 1.0e-4f;
    float connectionGain    = 0.5f;

    // Autonomous drift
    float homeStrength      = 0.002f;

    // Manual override
    float holdMinSeconds    = 10.0f;
    float holdMaxSeconds    = 60.0f;
    float releaseMinSeconds = 20.0f;
    float releaseMaxSeconds = 60.0f;
    float releaseEaseFloor  = 0.08f;

    // Parameter shifts
    int   maxActiveShifts       = 2;
    float shiftSpawnChance      = 0.001f;
    float feedbackSpawnChance   = 0.01f;
    float feedbackThreshold     = 0.3f;
    float feedbackDecay         = 0.995f;
    float audioShiftBias        = 0.6f;
    float initialSpawnInterval  = 10.0f;

    // Focus mode
    float focusFirstMin     = 10.0f;
    float focusFirstMax     = 30.0f;
    float focusActiveMin    = 8.0f;
    float focusActiveMax    = 20.0f;
    float focusIdleMin      = 15.0f;
    float focusIdleMax      = 45.0f;
    float focusEnterRate    = 0.02f;
    float focusLeaveRate    = 0.015f;

    // Pendulum
    float pendulumDamping    = 0.998f;
    float pendulumStiffness  = 0.00003f;
    float pendulumDriftForce = 0.00001f;
    float pendulumBlend      = 0.005f;

    // Connection graph
    int randomConnectionCount = 15;

    juce::var toVar() const;
    static EngineConfig fromVar(const juce::var& v);

    static EngineConfig loadFromFile(const juce::File& file);
    bool saveToFile(const juce::File& file) const;
};

} // namespace reflection
