#include "Session.h"
#include "../Model/StateSnapshot.h"
#include <algorithm>
#include <cmath>

namespace reflection {

Session::Session(const EngineConfig& config)
    : config_(config),
      engine_(std::make_unique<StateEngine>(config))
{
    refreshProjections();
    DBG("[session] started, seed " << (juce::int64)engine_->seed());
}

void Session::advance(float deltaSeconds)
{
    if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0f)
        deltaSeconds = 0.0f;

    input_.drainInto(*engine_);
    engine_->update(std::min(deltaSeconds, kMaxFrameDelta));
    refreshProjections();
    ++frames_;
}

void Session::handleKey(char key)
{
    if (key == 'g' || key == 'G') {
        engine_->toggleFocusMode();
        return;
    }
    engine_->handleKeyPress(key);
}

void Session::faceFrame(bool detected, float faceX, float faceY, float faceSize, float deltaSeconds)
{
    float dt = std::isfinite(deltaSeconds) ? std::min(std::max(deltaSeconds, 0.0f), kMaxFrameDelta) : 0.0f;
    bool usable = std::isfinite(faceX) && std::isfinite(faceY) && std::isfinite(faceSize);
    if (!detected || !usable) {
        faceSmoother_.decay(dt);
        return;
    }

    faceSmoother_.track(faceX, faceY, faceSize, dt);
    auto& p = faceSmoother_.push();
    engine_->handleFacePositionSmooth(p.x, p.y, p.size);
}

void Session::refreshProjections()
{
    visual_ = engine_->getVisualState();
    audio_ = engine_->getAudioState();
}

juce::String Session::saveState() const
{
    auto* root = new juce::DynamicObject();
    root->setProperty("config", config_.toVar());
    root->setProperty("frames", frames_);
    root->setProperty("snapshot", StateSnapshot::capture(*engine_));
    return juce::JSON::toString(juce::var(root));
}

bool Session::restoreState(const juce::String& json)
{
    auto parsed = juce::JSON::parse(json);
    if (!parsed.isObject()) {
        DBG("[session] state blob is not a JSON object");
        return false;
    }

    auto snapshot = parsed.getProperty("snapshot", {});
    if (!snapshot.isObject()) {
        DBG("[session] state blob has no snapshot");
        return false;
    }

    int restored = StateSnapshot::restore(*engine_, snapshot);
    refreshProjections();
    DBG("[session] restored " << restored << " dimensions");
    return restored > 0;
}

void Session::getStateInformation(juce::MemoryBlock& destData) const
{
    auto json = saveState();
    destData.append(json.toRawUTF8(), json.getNumBytesAsUTF8());
}

bool Session::setStateInformation(const void* data, int sizeInBytes)
{
    auto json = juce::String::fromUTF8(static_cast<const char*>(data), sizeInBytes);
    return restoreState(json);
}

} // namespace reflection
