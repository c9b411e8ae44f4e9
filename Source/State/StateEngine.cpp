#include "StateEngine.h"
#include <algorithm>
#include <cmath>

namespace reflection {

static float wrap01(float v)
{
    float w = std::fmod(std::fmod(v, 1.0f) + 1.0f, 1.0f);
    return w < 1.0f ? w : 0.0f;
}

// Pinned values must survive wrapValues() unchanged
static float pinnable(int index, float v)
{
    return isHueDimension(index) ? wrap01(v) : std::max(0.0f, std::min(1.0f, v));
}

static EngineConfig withSeed(uint32_t seed)
{
    EngineConfig c;
    c.seed = seed;
    return c;
}

StateEngine::StateEngine(const EngineConfig& config)
    : config_(config),
      rng_(config.seed != 0 ? config.seed : SessionRandom::platformSeed())
{
    initialize();
}

StateEngine::StateEngine(uint32_t seed)
    : StateEngine(withSeed(seed))
{
}

// ============================================================
// Initialization
// ============================================================
void StateEngine::initialize()
{
    std::string problem;
    if (!Dimensions::validateAliasTable(&problem))
        DBG("[state] alias table inconsistent: " << juce::String(problem));

    staticDims_ = {indexOf(Dim::Vignette)};

    for (int i = 0; i < kDimensionCount; ++i) {
        auto idx = (size_t)i;
        current_[idx] = 0.5f;
        target_[idx] = 0.5f;
        velocity_[idx] = 0.0f;
        influence_[idx] = 0.0f;
        autoFactors_[idx] = 1.0f;
        overrides_[idx] = OverrideState();

        drift_[idx] = (rng_.uniform() - 0.5f) * 0.5f;
        smoothing_[idx] = 0.995f + rng_.uniform() * 0.004f;
        driftSpeed_[idx] = 0.00001f + rng_.uniform() * 0.00002f;
        driftScale_[idx] = 0.001f + rng_.uniform() * 0.001f;
    }

    initPalette();

    // Shape / wave
    setInitial(Dim::ShapeType, 0.0f);
    setInitial(Dim::WaveDelay, 0.65f);
    setInitial(Dim::WaveAmplitude, 0.35f);
    setInitial(Dim::WaveSpeed, 0.4f);
    setInitial(Dim::EdgeSharpness, 0.6f);
    setInitial(Dim::MinRadius, 0.08f);
    setInitial(Dim::ShapeRotation, 0.0f);
    setInitial(Dim::RotationSpeed, 0.05f);
    setInitial(Dim::DisplacementStrength, 0.15f);

    auto shape = (size_t)indexOf(Dim::ShapeType);
    driftSpeed_[shape] = 0.00005f;
    driftScale_[shape] = 0.008f;
    smoothing_[shape] = 0.995f;

    setInitial(Dim::BrightnessEvolution, 0.5f);
    auto evo = (size_t)indexOf(Dim::BrightnessEvolution);
    drift_[evo] = 0.1f;
    driftSpeed_[evo] = 0.00003f;
    driftScale_[evo] = 0.003f;

    auto bright = (size_t)indexOf(Dim::ColorBrightness);
    drift_[bright] = 0.15f;
    driftSpeed_[bright] = 0.00005f;
    driftScale_[bright] = 0.005f;

    auto post = (size_t)indexOf(Dim::BrightnessPost);
    drift_[post] = 0.1f;
    driftSpeed_[post] = 0.00004f;
    driftScale_[post] = 0.004f;

    setInitial(Dim::Vignette, 0.0f);

    // Audio levels match the synth's slider defaults
    setInitial(Dim::DroneBaseVolume, 0.625f);
    setInitial(Dim::DroneMidVolume, 0.55f);
    setInitial(Dim::DroneHighVolume, 0.125f);
    setInitial(Dim::FilterCutoff, 0.16f);
    setInitial(Dim::FilterResonance, 0.16f);
    setInitial(Dim::ReverbAmount, 0.08f);
    setInitial(Dim::DelayAmount, 0.05f);

    home_ = current_;

    connections_.build(rng_, staticDims_, config_.randomConnectionCount);
    keyMappings_.build(rng_);
    pendulum_.randomize(rng_);
    focus_.reset(rng_, config_);
    shifts_.reset(config_);

    DBG("[state] initialized: " << kDimensionCount << " dimensions, "
        << connections_.size() << " connections, "
        << keyMappings_.size() << " keys, harmony " << harmonyName(harmony_)
        << ", seed " << (juce::int64)rng_.seed());
}

void StateEngine::initPalette()
{
    float base = rng_.uniform();
    harmony_ = (Harmony)rng_.index(4);

    float h2 = 0, h3 = 0, h4 = 0;
    switch (harmony_) {
        case Harmony::Analogous:
            h2 = base + 0.08f + rng_.uniform() * 0.06f;
            h3 = base - 0.1f - rng_.uniform() * 0.08f + 1.0f;
            h4 = base + 0.2f + rng_.uniform() * 0.1f;
            break;
        case Harmony::Complementary:
            h2 = base + 0.5f + (rng_.uniform() - 0.5f) * 0.1f;
            h3 = base + 0.15f + rng_.uniform() * 0.1f;
            h4 = base + 0.6f + rng_.uniform() * 0.1f;
            break;
        case Harmony::Triadic:
            h2 = base + 0.33f + (rng_.uniform() - 0.5f) * 0.08f;
            h3 = base + 0.67f + (rng_.uniform() - 0.5f) * 0.08f;
            h4 = base + 0.17f + rng_.uniform() * 0.1f;
            break;
        case Harmony::SplitComplementary:
            h2 = base + 0.4f + rng_.uniform() * 0.08f;
            h3 = base + 0.6f + rng_.uniform() * 0.08f;
            h4 = base + 0.12f + rng_.uniform() * 0.1f;
            break;
    }

    setInitial(Dim::ColorHue1, base);
    setInitial(Dim::ColorHue2, wrap01(h2));
    setInitial(Dim::ColorHue3, wrap01(h3));
    setInitial(Dim::ColorHue4, wrap01(h4));
    setInitial(Dim::ColorSaturation, 0.82f + rng_.uniform() * 0.12f);
    setInitial(Dim::ColorBrightness, 0.58f + rng_.uniform() * 0.08f);
}

void StateEngine::setInitial(Dim d, float value)
{
    auto i = (size_t)indexOf(d);
    current_[i] = value;
    target_[i] = value;
}

const char* StateEngine::harmonyName(Harmony h)
{
    switch (h) {
        case Harmony::Analogous:          return "analogous";
        case Harmony::Complementary:      return "complementary";
        case Harmony::Triadic:            return "triadic";
        case Harmony::SplitComplementary: return "split-complementary";
    }
    return "analogous";
}

// ============================================================
// Update pipeline
// ============================================================
void StateEngine::update(float deltaTime)
{
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f)
        return;

    time_ += deltaTime;

    updateAutoFactors();
    applyLocks();

    updatePendulum(deltaTime);
    focus_.update(time_, rng_, config_);

    shifts_.advance(deltaTime, target_, autoFactors_);
    shifts_.maybeSpawn(time_, rng_, config_, current_, [this](int i) { return isBlockedForShift(i); });

    applyDrift(deltaTime);
    applyConnections(deltaTime);
    applyInfluences(deltaTime);
    smoothUpdate(deltaTime);
    wrapValues();
    decayInfluences(deltaTime);
}

void StateEngine::updateAutoFactors()
{
    for (int i = 0; i < kDimensionCount; ++i) {
        auto idx = (size_t)i;
        overrides_[idx].settle(time_);
        if (isStatic(i))
            autoFactors_[idx] = 0.0f;
        else
            autoFactors_[idx] = overrides_[idx].autoFactor(time_, config_.releaseEaseFloor);
    }
}

void StateEngine::applyLocks()
{
    for (int i = 0; i < kDimensionCount; ++i) {
        auto idx = (size_t)i;
        auto mode = overrides_[idx].mode(time_);
        if (mode == OverrideState::Mode::Locked || mode == OverrideState::Mode::Held) {
            float v = overrides_[idx].pinnedValue(time_);
            current_[idx] = v;
            target_[idx] = v;
            velocity_[idx] = 0.0f;
            continue;
        }

        // Freeze without snapping
        if (isStatic(i)) {
            target_[idx] = current_[idx];
            velocity_[idx] *= 0.5f;
        }
    }
}

void StateEngine::updatePendulum(float deltaTime)
{
    pendulum_.step(deltaTime, time_, config_);

    float blend = config_.pendulumBlend;
    auto ox = (size_t)indexOf(Dim::GradientOffsetX);
    auto oy = (size_t)indexOf(Dim::GradientOffsetY);
    auto rot = (size_t)indexOf(Dim::DisplacementRotation);

    // Overridden dimensions keep their pinned target
    if (autoFactors_[ox] > 0.0f)
        target_[ox] += (pendulum_.offsetX() - target_[ox]) * blend;
    if (autoFactors_[oy] > 0.0f)
        target_[oy] += (pendulum_.offsetY() - target_[oy]) * blend;
    if (autoFactors_[rot] > 0.0f)
        target_[rot] += (pendulum_.rotation() - target_[rot]) * blend * 0.2f;
}

void StateEngine::applyDrift(float deltaTime)
{
    float t = (float)time_;
    for (int i = 0; i < kDimensionCount; ++i) {
        auto idx = (size_t)i;
        float af = autoFactors_[idx];
        if (af <= 0.0f) continue;

        // Home attraction
        target_[idx] += (home_[idx] - target_[idx]) * config_.homeStrength * deltaTime * 60.0f * af;

        float nt = t * driftSpeed_[idx];
        float offset = (float)i * 100.0f;
        float noise = std::sin(nt + offset) * 0.5f
                    + std::sin(nt * 1.7f + offset * 0.3f) * 0.3f
                    + std::sin(nt * 0.4f + offset * 0.7f) * 0.2f;

        target_[idx] += noise * driftScale_[idx] * deltaTime * af;
    }
}

void StateEngine::applyConnections(float deltaTime)
{
    Values coupling {};
    connections_.accumulate(current_, autoFactors_, deltaTime, config_.connectionGain, coupling);
    for (size_t i = 0; i < coupling.size(); ++i)
        target_[i] += coupling[i];
}

void StateEngine::applyInfluences(float deltaTime)
{
    for (size_t i = 0; i < (size_t)kDimensionCount; ++i) {
        float af = autoFactors_[i];
        if (af <= 0.0f) continue;
        if (std::abs(influence_[i]) > config_.influenceEpsilon)
            target_[i] += influence_[i] * deltaTime * af;
    }
}

void StateEngine::smoothUpdate(float deltaTime)
{
    const float margin = config_.elasticMargin;
    const float step = std::min(deltaTime * 60.0f, 1.0f);

    for (size_t i = 0; i < (size_t)kDimensionCount; ++i) {
        float af = autoFactors_[i];
        if (af <= 0.0f) {
            velocity_[i] = 0.0f;
            continue;
        }

        float diff = target_[i] - current_[i];
        float accel = (1.0f - smoothing_[i]) * config_.acceleration * af;
        velocity_[i] = velocity_[i] * config_.momentum + diff * accel;

        // Rubber band near the edges instead of a hard stop
        if (current_[i] < margin)
            velocity_[i] += (margin - current_[i]) * config_.elasticity;
        else if (current_[i] > 1.0f - margin)
            velocity_[i] -= (current_[i] - (1.0f - margin)) * config_.elasticity;

        float cap = config_.velocityCap * (0.2f + af * 0.8f);
        velocity_[i] = std::max(-cap, std::min(cap, velocity_[i]));

        current_[i] += velocity_[i] * step;
    }
}

void StateEngine::wrapValues()
{
    for (int i = 0; i < kDimensionCount; ++i) {
        auto idx = (size_t)i;
        if (isHueDimension(i)) {
            current_[idx] = wrap01(current_[idx]);
            target_[idx] = wrap01(target_[idx]);
        } else {
            current_[idx] = std::max(-0.05f, std::min(1.05f, current_[idx]));
            target_[idx] = std::max(0.0f, std::min(1.0f, target_[idx]));
        }
    }
}

void StateEngine::decayInfluences(float deltaTime)
{
    float decay = std::pow(config_.influenceDecay, deltaTime * 60.0f);
    for (auto& v : influence_)
        v *= decay;
}

// ============================================================
// Manual override
// ============================================================
void StateEngine::setDimensionValue(const std::string& name, float value)
{
    int i = Dimensions::find(name);
    if (i == kInvalidDimension || !std::isfinite(value)) return;
    current_[(size_t)i] = value;
    target_[(size_t)i] = value;
}

void StateEngine::setManualValue(const std::string& name, float value)
{
    int i = Dimensions::find(name);
    if (i == kInvalidDimension || !std::isfinite(value)) return;
    auto idx = (size_t)i;
    value = pinnable(i, value);
    current_[idx] = value;
    target_[idx] = value;
    velocity_[idx] = 0.0f;

    float hold = rng_.range(config_.holdMinSeconds, config_.holdMaxSeconds);
    float release = rng_.range(config_.releaseMinSeconds, config_.releaseMaxSeconds);
    overrides_[idx].engageHold(value, time_, hold, release);
}

void StateEngine::lockDimension(const std::string& name, float value)
{
    int i = Dimensions::find(name);
    if (i == kInvalidDimension || !std::isfinite(value)) return;
    auto idx = (size_t)i;
    value = pinnable(i, value);
    overrides_[idx].lock(value);
    current_[idx] = value;
    target_[idx] = value;
    velocity_[idx] = 0.0f;
}

void StateEngine::unlockDimension(const std::string& name)
{
    int i = Dimensions::find(name);
    if (i == kInvalidDimension) return;
    overrides_[(size_t)i].unlock();
}

void StateEngine::setTargetValue(const std::string& name, float value)
{
    int i = Dimensions::find(name);
    if (i == kInvalidDimension || !std::isfinite(value)) return;
    target_[(size_t)i] = value;
    velocity_[(size_t)i] *= 0.5f;
}

bool StateEngine::isBlockedForShift(int i) const
{
    auto& o = overrides_[(size_t)i];
    return isStatic(i) || o.isLocked() || o.isHeld(time_);
}

OverrideState::Mode StateEngine::overrideMode(int i) const
{
    if (i < 0 || i >= kDimensionCount) return OverrideState::Mode::Free;
    return overrides_[(size_t)i].mode(time_);
}

bool StateEngine::spawnParameterShift(bool isFeedback)
{
    if ((int)shifts_.active().size() >= config_.maxActiveShifts)
        return false;
    return shifts_.spawn(isFeedback, time_, rng_, config_, current_, [this](int i) { return isBlockedForShift(i); });
}

void StateEngine::setFocusMode(bool active, float intensity)
{
    if (!std::isfinite(intensity)) return;
    focus_.set(active, intensity);
}

void StateEngine::toggleFocusMode()
{
    focus_.set(!focus_.isActive(), rng_.range(0.6f, 1.0f));
}

// ============================================================
// Reads
// ============================================================
float StateEngine::get(const std::string& name) const
{
    return read(current_, Dimensions::find(name));
}

float StateEngine::getScaled(const std::string& name, float min, float max) const
{
    return min + get(name) * (max - min);
}

std::vector<float> StateEngine::getArray(const std::vector<std::string>& names) const
{
    std::vector<float> out;
    out.reserve(names.size());
    for (auto& n : names)
        out.push_back(get(n));
    return out;
}

juce::var StateEngine::getAllState() const
{
    auto obj = new juce::DynamicObject();
    for (auto& name : Dimensions::allNames()) {
        double v = std::round((double)get(name) * 1000.0) / 1000.0;
        obj->setProperty(juce::Identifier(juce::String(name)), v);
    }
    return juce::var(obj);
}

} // namespace reflection
