#pragma once

#include "Dimensions.h"
#include "SessionRandom.h"
#include "OverrideState.h"
#include "ConnectionGraph.h"
#include "KeyMappings.h"
#include "Pendulum.h"
#include "FocusMode.h"
#include "ParameterShifts.h"
#include "Projection.h"
#include "../Model/EngineConfig.h"
#include "../Input/InputFeatures.h"
#include <juce_core/juce_core.h>
#include <array>
#include <set>
#include <string>
#include <vector>

namespace reflection {

// ============================================================
// StateEngine: 64-dimensional continuous parameter space.
//
// Inputs only ever add to the influence accumulator; update()
// turns influence, drift and coupling into target motion, then
// integrates current toward target with momentum and elastic
// boundaries. Renderer and synthesizer read the projections.
//
// Single-threaded: handlers and update() must run on the same
// thread (see InputQueue for multi-threaded hosts).
// ============================================================
class StateEngine {
public:
    enum class Harmony { Analogous = 0, Complementary, Triadic, SplitComplementary };

    explicit StateEngine(const EngineConfig& config = EngineConfig());
    explicit StateEngine(uint32_t seed);

    // Per-frame pipeline, deltaTime in seconds
    void update(float deltaTime);

    // --- Inputs (influence only) ---
    void handleKeyPress(char key);
    void handleMouseMove(float x, float y);
    void handleGestureInput(const GestureData& gesture);
    void handleAudioInput(float volume, float bass, float mid, float treble);
    void handleFacePosition(float x, float y, float size);
    void handleFacePositionSmooth(float pushX, float pushY, float pushSize);
    void handleFaceFeatures(const FaceFeatures& face);
    void handleBlink();
    void handleTalking(bool isTalking);
    void handleMotion(float tiltX, float tiltY, float shake);
    void triggerInputFeedback(float intensity);

    // Raw injection into one dimension's accumulator
    void addInfluence(const std::string& name, float amount);

    void setFocusMode(bool active, float intensity = 0.8f);

    // Flip focus on/off; entering picks an intensity in [0.6, 1)
    void toggleFocusMode();

    // --- Manual override ---
    // Held and locked values are stored wrapped (hues) or clamped to [0, 1]
    void setDimensionValue(const std::string& name, float value);
    void setManualValue(const std::string& name, float value);
    void lockDimension(const std::string& name, float value);
    void unlockDimension(const std::string& name);
    void setTargetValue(const std::string& name, float value);

    // One spawn attempt, bypassing the random gate (cap still applies)
    bool spawnParameterShift(bool isFeedback = false);

    // --- Reads ---
    float get(const std::string& name) const;
    float getScaled(const std::string& name, float min, float max) const;
    std::vector<float> getArray(const std::vector<std::string>& names) const;
    juce::var getAllState() const;

    VisualState getVisualState() const;
    AudioState getAudioState() const;

    static int dimensionIndex(const std::string& name) { return Dimensions::find(name); }
    static const std::string& dimensionName(int index) { return Dimensions::nameOf(index); }
    static constexpr int dimensionCount() { return kDimensionCount; }

    // Index-based introspection (out of range reads 0)
    float current(int i) const   { return read(current_, i); }
    float target(int i) const    { return read(target_, i); }
    float velocity(int i) const  { return read(velocity_, i); }
    float influence(int i) const { return read(influence_, i); }
    float homeValue(int i) const { return read(home_, i); }
    float autoFactor(int i) const { return read(autoFactors_, i); }
    float smoothing(int i) const { return read(smoothing_, i); }
    float drift(int i) const     { return read(drift_, i); }
    OverrideState::Mode overrideMode(int i) const;
    bool isStatic(int i) const { return staticDims_.count(i) > 0; }

    double time() const { return time_; }
    uint32_t seed() const { return rng_.seed(); }
    Harmony harmony() const { return harmony_; }
    const EngineConfig& config() const { return config_; }

    const FocusMode& focusMode() const { return focus_; }
    float focusIntensity() const { return focus_.intensity(); }
    const Pendulum& pendulum() const { return pendulum_; }
    const ParameterShifts& shifts() const { return shifts_; }
    const std::vector<ParameterShift>& activeShifts() const { return shifts_.active(); }

    ConnectionGraph& connections() { return connections_; }
    const ConnectionGraph& connections() const { return connections_; }
    const KeyMappings& keyMappings() const { return keyMappings_; }
    const std::set<int>& staticDimensions() const { return staticDims_; }

    static const char* harmonyName(Harmony h);

private:
    using Values = std::array<float, kDimensionCount>;

    void initialize();
    void initPalette();
    void setInitial(Dim d, float value);

    // Pipeline stages
    void updateAutoFactors();
    void applyLocks();
    void updatePendulum(float deltaTime);
    void applyDrift(float deltaTime);
    void applyConnections(float deltaTime);
    void applyInfluences(float deltaTime);
    void smoothUpdate(float deltaTime);
    void wrapValues();
    void decayInfluences(float deltaTime);

    bool isBlockedForShift(int i) const;

    // Non-finite amounts are dropped
    void bump(Dim d, float amount);
    void bump(int index, float amount);

    float cur(Dim d) const { return current_[(size_t)indexOf(d)]; }
    float scaled(Dim d, float min, float max) const { return min + cur(d) * (max - min); }
    float orbitX(int index, float radius) const;
    float orbitY(int index, float radius) const;

    static float read(const Values& v, int i)
    {
        return (i >= 0 && i < kDimensionCount) ? v[(size_t)i] : 0.0f;
    }

    EngineConfig config_;
    SessionRandom rng_;
    double time_ = 0.0;
    Harmony harmony_ = Harmony::Analogous;

    Values current_ {};
    Values target_ {};
    Values velocity_ {};
    Values drift_ {};
    Values driftSpeed_ {};
    Values driftScale_ {};
    Values smoothing_ {};
    Values influence_ {};
    Values home_ {};
    Values autoFactors_ {};
    std::array<OverrideState, kDimensionCount> overrides_;
    std::set<int> staticDims_;

    ConnectionGraph connections_;
    KeyMappings keyMappings_;
    Pendulum pendulum_;
    FocusMode focus_;
    ParameterShifts shifts_;
};

} // namespace reflection
