#include "InputQueue.h"
#include "../State/StateEngine.h"

namespace reflection {

void InputQueue::push(InputEvent&& e)
{
    juce::SpinLock::ScopedLockType lock(lock_);
    events_.push_back(std::move(e));
}

void InputQueue::postKey(char key)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Key;
    e.key = key;
    push(std::move(e));
}

void InputQueue::postMouseMove(float x, float y)
{
    InputEvent e;
    e.kind = InputEvent::Kind::MouseMove;
    e.a = x;
    e.b = y;
    push(std::move(e));
}

void InputQueue::postGesture(const GestureData& g)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Gesture;
    e.gesture = g;
    push(std::move(e));
}

void InputQueue::postAudio(float volume, float bass, float mid, float treble)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Audio;
    e.a = volume;
    e.b = bass;
    e.c = mid;
    e.d = treble;
    push(std::move(e));
}

void InputQueue::postFacePosition(float x, float y, float size)
{
    InputEvent e;
    e.kind = InputEvent::Kind::FacePosition;
    e.a = x;
    e.b = y;
    e.c = size;
    push(std::move(e));
}

void InputQueue::postFacePositionSmooth(float pushX, float pushY, float pushSize)
{
    InputEvent e;
    e.kind = InputEvent::Kind::FacePositionSmooth;
    e.a = pushX;
    e.b = pushY;
    e.c = pushSize;
    push(std::move(e));
}

void InputQueue::postFaceFeatures(const FaceFeatures& f)
{
    InputEvent e;
    e.kind = InputEvent::Kind::FaceFeatures;
    e.face = f;
    push(std::move(e));
}

void InputQueue::postBlink()
{
    InputEvent e;
    e.kind = InputEvent::Kind::Blink;
    push(std::move(e));
}

void InputQueue::postTalking(bool isTalking)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Talking;
    e.flag = isTalking;
    push(std::move(e));
}

void InputQueue::postMotion(float tiltX, float tiltY, float shake)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Motion;
    e.a = tiltX;
    e.b = tiltY;
    e.c = shake;
    push(std::move(e));
}

void InputQueue::postFeedback(float intensity)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Feedback;
    e.a = intensity;
    push(std::move(e));
}

void InputQueue::postInfluence(const std::string& name, float amount)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Influence;
    e.name = name;
    e.a = amount;
    push(std::move(e));
}

void InputQueue::postManualValue(const std::string& name, float value)
{
    InputEvent e;
    e.kind = InputEvent::Kind::ManualValue;
    e.name = name;
    e.a = value;
    push(std::move(e));
}

void InputQueue::postLock(const std::string& name, float value)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Lock;
    e.name = name;
    e.a = value;
    push(std::move(e));
}

void InputQueue::postUnlock(const std::string& name)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Unlock;
    e.name = name;
    push(std::move(e));
}

void InputQueue::postTargetValue(const std::string& name, float value)
{
    InputEvent e;
    e.kind = InputEvent::Kind::TargetValue;
    e.name = name;
    e.a = value;
    push(std::move(e));
}

void InputQueue::postFocus(bool active, float intensity)
{
    InputEvent e;
    e.kind = InputEvent::Kind::Focus;
    e.flag = active;
    e.a = intensity;
    push(std::move(e));
}

int InputQueue::pending() const
{
    juce::SpinLock::ScopedLockType lock(lock_);
    return (int)events_.size();
}

int InputQueue::drainInto(StateEngine& engine)
{
    // Swap out under the lock, dispatch without it
    {
        juce::SpinLock::ScopedLockType lock(lock_);
        draining_.swap(events_);
    }

    for (auto& e : draining_)
        dispatch(e, engine);

    int count = (int)draining_.size();
    draining_.clear();
    return count;
}

void InputQueue::dispatch(const InputEvent& e, StateEngine& engine)
{
    using K = InputEvent::Kind;
    switch (e.kind) {
        case K::Key:                engine.handleKeyPress(e.key); break;
        case K::MouseMove:          engine.handleMouseMove(e.a, e.b); break;
        case K::Gesture:            engine.handleGestureInput(e.gesture); break;
        case K::Audio:              engine.handleAudioInput(e.a, e.b, e.c, e.d); break;
        case K::FacePosition:       engine.handleFacePosition(e.a, e.b, e.c); break;
        case K::FacePositionSmooth: engine.handleFacePositionSmooth(e.a, e.b, e.c); break;
        case K::FaceFeatures:       engine.handleFaceFeatures(e.face); break;
        case K::Blink:              engine.handleBlink(); break;
        case K::Talking:            engine.handleTalking(e.flag); break;
        case K::Motion:             engine.handleMotion(e.a, e.b, e.c); break;
        case K::Feedback:           engine.triggerInputFeedback(e.a); break;
        case K::Influence:          engine.addInfluence(e.name, e.a); break;
        case K::ManualValue:        engine.setManualValue(e.name, e.a); break;
        case K::Lock:               engine.lockDimension(e.name, e.a); break;
        case K::Unlock:             engine.unlockDimension(e.name); break;
        case K::TargetValue:        engine.setTargetValue(e.name, e.a); break;
        case K::Focus:              engine.setFocusMode(e.flag, e.a); break;
    }
}

} // namespace reflection
