#pragma once

#include "../State/StateEngine.h"
#include "../Input/InputQueue.h"
#include "../Input/FaceSmoother.h"
#include <juce_core/juce_core.h>
#include <memory>

namespace reflection {

// ============================================================
// Session: owns one engine for the life of the installation.
// Frame thread calls advance(); trackers post into input().
// ============================================================
class Session {
public:
    static constexpr float kMaxFrameDelta = 0.1f;

    explicit Session(const EngineConfig& config = EngineConfig());

    // Drain queued input, cap dt, update, refresh projections
    void advance(float deltaSeconds);

    // Host key binding: 'g' toggles focus, everything else plays the engine
    void handleKey(char key);

    // Per-frame face sample from the tracker (frame thread)
    void faceFrame(bool detected, float faceX, float faceY, float faceSize, float deltaSeconds);

    StateEngine& engine() { return *engine_; }
    const StateEngine& engine() const { return *engine_; }
    InputQueue& input() { return input_; }
    const FaceSmoother& faceSmoother() const { return faceSmoother_; }

    const VisualState& visualState() const { return visual_; }
    const AudioState& audioState() const { return audio_; }
    juce::int64 frameCount() const { return frames_; }

    // JSON blob: config + snapshot
    void getStateInformation(juce::MemoryBlock& destData) const;
    bool setStateInformation(const void* data, int sizeInBytes);

    juce::String saveState() const;
    bool restoreState(const juce::String& json);

private:
    void refreshProjections();

    EngineConfig config_;
    std::unique_ptr<StateEngine> engine_;
    InputQueue input_;
    FaceSmoother faceSmoother_;

    VisualState visual_;
    AudioState audio_;
    juce::int64 frames_ = 0;
};

} // namespace reflection
