#pragma once

#include "InputFeatures.h"
#include <juce_core/juce_core.h>
#include <string>
#include <vector>

namespace reflection {

class StateEngine;

// One deferred engine call
struct InputEvent {
    enum class Kind {
        Key, MouseMove, Gesture, Audio, FacePosition, FacePositionSmooth,
        FaceFeatures, Blink, Talking, Motion, Feedback, Influence,
        ManualValue, Lock, Unlock, TargetValue, Focus
    };

    Kind kind = Kind::Blink;
    float a = 0.0f, b = 0.0f, c = 0.0f, d = 0.0f;
    bool flag = false;
    char key = 0;
    std::string name;
    GestureData gesture;
    FaceFeatures face;
};

// ============================================================
// InputQueue: multi-producer, single-consumer funnel for
// trackers running on their own threads. Producers post from
// anywhere; the frame thread drains into the engine right
// before update(), so handlers never race the pipeline.
// ============================================================
class InputQueue {
public:
    void postKey(char key);
    void postMouseMove(float x, float y);
    void postGesture(const GestureData& g);
    void postAudio(float volume, float bass, float mid, float treble);
    void postFacePosition(float x, float y, float size);
    void postFacePositionSmooth(float pushX, float pushY, float pushSize);
    void postFaceFeatures(const FaceFeatures& f);
    void postBlink();
    void postTalking(bool isTalking);
    void postMotion(float tiltX, float tiltY, float shake);
    void postFeedback(float intensity);
    void postInfluence(const std::string& name, float amount);

    // Slider-style overrides
    void postManualValue(const std::string& name, float value);
    void postLock(const std::string& name, float value);
    void postUnlock(const std::string& name);
    void postTargetValue(const std::string& name, float value);
    void postFocus(bool active, float intensity);

    // Consumer side: apply everything posted so far, in order.
    // Returns the number of events applied.
    int drainInto(StateEngine& engine);

    int pending() const;

private:
    void push(InputEvent&& e);
    static void dispatch(const InputEvent& e, StateEngine& engine);

    std::vector<InputEvent> events_;
    std::vector<InputEvent> draining_;
    mutable juce::SpinLock lock_;
};

} // namespace reflection
