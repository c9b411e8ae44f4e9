#include "EngineConfig.h"
#include <cmath>
#include <utility>

namespace reflection {

static juce::var section(juce::DynamicObject* parent, const char* key)
{
    auto obj = new juce::DynamicObject();
    parent->setProperty(key, juce::var(obj));
    return parent->getProperty(key);
}

juce::var EngineConfig::toVar() const
{
    auto root = new juce::DynamicObject();
    root->setProperty("seed", (juce::int64)seed);

    auto smoothing = section(root, "smoothing");
    if (auto* o = smoothing.getDynamicObject()) {
        o->setProperty("momentum", momentum);
        o->setProperty("acceleration", acceleration);
        o->setProperty("velocity_cap", velocityCap);
        o->setProperty("elastic_margin", elasticMargin);
        o->setProperty("elasticity", elasticity);
        o->setProperty("influence_decay", influenceDecay);
        o->setProperty("influence_epsilon", influenceEpsilon);
        o->setProperty("connection_gain", connectionGain);
        o->setProperty("home_strength", homeStrength);
    }

    auto manual = section(root, "manual");
    if (auto* o = manual.getDynamicObject()) {
        o->setProperty("hold_min", holdMinSeconds);
        o->setProperty("hold_max", holdMaxSeconds);
        o->setProperty("release_min", releaseMinSeconds);
        o->setProperty("release_max", releaseMaxSeconds);
        o->setProperty("release_ease_floor", releaseEaseFloor);
    }

    auto shifts = section(root, "shifts");
    if (auto* o = shifts.getDynamicObject()) {
        o->setProperty("max_active", maxActiveShifts);
        o->setProperty("spawn_chance", shiftSpawnChance);
        o->setProperty("feedback_spawn_chance", feedbackSpawnChance);
        o->setProperty("feedback_threshold", feedbackThreshold);
        o->setProperty("feedback_decay", feedbackDecay);
        o->setProperty("audio_bias", audioShiftBias);
        o->setProperty("initial_interval", initialSpawnInterval);
    }

    auto focus = section(root, "focus");
    if (auto* o = focus.getDynamicObject()) {
        o->setProperty("first_min", focusFirstMin);
        o->setProperty("first_max", focusFirstMax);
        o->setProperty("active_min", focusActiveMin);
        o->setProperty("active_max", focusActiveMax);
        o->setProperty("idle_min", focusIdleMin);
        o->setProperty("idle_max", focusIdleMax);
        o->setProperty("enter_rate", focusEnterRate);
        o->setProperty("leave_rate", focusLeaveRate);
    }

    auto pendulum = section(root, "pendulum");
    if (auto* o = pendulum.getDynamicObject()) {
        o->setProperty("damping", pendulumDamping);
        o->setProperty("stiffness", pendulumStiffness);
        o->setProperty("drift_force", pendulumDriftForce);
        o->setProperty("blend", pendulumBlend);
    }

    root->setProperty("random_connections", randomConnectionCount);
    return juce::var(root);
}

EngineConfig EngineConfig::fromVar(const juce::var& v)
{
    EngineConfig c;
    auto* root = v.getDynamicObject();
    if (!root) return c;

    // Missing or non-numeric fields keep their defaults
    auto read = [](const juce::var& obj, const char* key, float def) -> float {
        auto* o = obj.getDynamicObject();
        if (!o || !o->hasProperty(key)) return def;
        auto p = o->getProperty(key);
        if (!(p.isDouble() || p.isInt() || p.isInt64())) return def;
        double d = (double)p;
        return std::isfinite(d) ? (float)d : def;
    };
    auto readInt = [&](const juce::var& obj, const char* key, int def) -> int {
        return juce::roundToInt(read(obj, key, (float)def));
    };

    if (root->hasProperty("seed")) {
        auto s = root->getProperty("seed");
        if (s.isInt() || s.isInt64() || s.isDouble())
            c.seed = (uint32_t)(juce::int64)s;
    }

    auto smoothing = root->getProperty("smoothing");
    c.momentum         = read(smoothing, "momentum", c.momentum);
    c.acceleration     = read(smoothing, "acceleration", c.acceleration);
    c.velocityCap      = read(smoothing, "velocity_cap", c.velocityCap);
    c.elasticMargin    = read(smoothing, "elastic_margin", c.elasticMargin);
    c.elasticity       = read(smoothing, "elasticity", c.elasticity);
    c.influenceDecay   = read(smoothing, "influence_decay", c.influenceDecay);
    c.influenceEpsilon = read(smoothing, "influence_epsilon", c.influenceEpsilon);
    c.connectionGain   = read(smoothing, "connection_gain", c.connectionGain);
    c.homeStrength     = read(smoothing, "home_strength", c.homeStrength);

    auto manual = root->getProperty("manual");
    c.holdMinSeconds    = read(manual, "hold_min", c.holdMinSeconds);
    c.holdMaxSeconds    = read(manual, "hold_max", c.holdMaxSeconds);
    c.releaseMinSeconds = read(manual, "release_min", c.releaseMinSeconds);
    c.releaseMaxSeconds = read(manual, "release_max", c.releaseMaxSeconds);
    c.releaseEaseFloor  = read(manual, "release_ease_floor", c.releaseEaseFloor);

    auto shifts = root->getProperty("shifts");
    c.maxActiveShifts      = juce::jmax(0, readInt(shifts, "max_active", c.maxActiveShifts));
    c.shiftSpawnChance     = read(shifts, "spawn_chance", c.shiftSpawnChance);
    c.feedbackSpawnChance  = read(shifts, "feedback_spawn_chance", c.feedbackSpawnChance);
    c.feedbackThreshold    = read(shifts, "feedback_threshold", c.feedbackThreshold);
    c.feedbackDecay        = read(shifts, "feedback_decay", c.feedbackDecay);
    c.audioShiftBias       = read(shifts, "audio_bias", c.audioShiftBias);
    c.initialSpawnInterval = read(shifts, "initial_interval", c.initialSpawnInterval);

    auto focus = root->getProperty("focus");
    c.focusFirstMin  = read(focus, "first_min", c.focusFirstMin);
    c.focusFirstMax  = read(focus, "first_max", c.focusFirstMax);
    c.focusActiveMin = read(focus, "active_min", c.focusActiveMin);
    c.focusActiveMax = read(focus, "active_max", c.focusActiveMax);
    c.focusIdleMin   = read(focus, "idle_min", c.focusIdleMin);
    c.focusIdleMax   = read(focus, "idle_max", c.focusIdleMax);
    c.focusEnterRate = read(focus, "enter_rate", c.focusEnterRate);
    c.focusLeaveRate = read(focus, "leave_rate", c.focusLeaveRate);

    auto pendulum = root->getProperty("pendulum");
    c.pendulumDamping    = read(pendulum, "damping", c.pendulumDamping);
    c.pendulumStiffness  = read(pendulum, "stiffness", c.pendulumStiffness);
    c.pendulumDriftForce = read(pendulum, "drift_force", c.pendulumDriftForce);
    c.pendulumBlend      = read(pendulum, "blend", c.pendulumBlend);

    c.randomConnectionCount = juce::jmax(0, readInt(v, "random_connections", c.randomConnectionCount));

    // Ranges must stay ordered
    if (c.holdMaxSeconds < c.holdMinSeconds) std::swap(c.holdMinSeconds, c.holdMaxSeconds);
    if (c.releaseMaxSeconds < c.releaseMinSeconds) std::swap(c.releaseMinSeconds, c.releaseMaxSeconds);
    if (c.focusActiveMax < c.focusActiveMin) std::swap(c.focusActiveMin, c.focusActiveMax);
    if (c.focusIdleMax < c.focusIdleMin) std::swap(c.focusIdleMin, c.focusIdleMax);
    if (c.focusFirstMax < c.focusFirstMin) std::swap(c.focusFirstMin, c.focusFirstMax);
    return c;
}

EngineConfig EngineConfig::loadFromFile(const juce::File& file)
{
    if (!file.existsAsFile()) {
        DBG("[config] Missing config file: " + file.getFullPathName());
        return {};
    }
    auto parsed = juce::JSON::parse(file.loadFileAsString());
    if (!parsed.isObject()) {
        DBG("[config] Could not parse " + file.getFullPathName() + ", using defaults");
        return {};
    }
    return fromVar(parsed);
}

bool EngineConfig::saveToFile(const juce::File& file) const
{
    return file.replaceWithText(juce::JSON::toString(toVar()));
}

} // namespace reflection
