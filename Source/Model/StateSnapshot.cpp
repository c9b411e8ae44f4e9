#include "StateSnapshot.h"
#include "../State/StateEngine.h"

namespace reflection {
namespace StateSnapshot {

juce::var capture(const StateEngine& engine)
{
    auto root = new juce::DynamicObject();
    root->setProperty("time", engine.time());
    root->setProperty("seed", (juce::int64)engine.seed());
    root->setProperty("harmony", StateEngine::harmonyName(engine.harmony()));

    auto& fm = engine.focusMode();
    auto focus = new juce::DynamicObject();
    focus->setProperty("active", fm.isActive());
    focus->setProperty("intensity", (double)fm.intensity());
    focus->setProperty("target_intensity", (double)fm.targetIntensity());
    focus->setProperty("next_transition", fm.nextTransition());
    root->setProperty("focus", juce::var(focus));

    juce::Array<juce::var> dims;
    for (int i = 0; i < StateEngine::dimensionCount(); ++i) {
        auto d = new juce::DynamicObject();
        d->setProperty("name", juce::String(StateEngine::dimensionName(i)));
        d->setProperty("current", (double)engine.current(i));
        d->setProperty("target", (double)engine.target(i));
        d->setProperty("home", (double)engine.homeValue(i));
        d->setProperty("velocity", (double)engine.velocity(i));
        d->setProperty("influence", (double)engine.influence(i));
        d->setProperty("auto_factor", (double)engine.autoFactor(i));
        d->setProperty("drift", (double)engine.drift(i));
        d->setProperty("mode", juce::String(OverrideState::modeToString(engine.overrideMode(i))));
        dims.add(juce::var(d));
    }
    root->setProperty("dimensions", dims);

    juce::Array<juce::var> shifts;
    for (auto& s : engine.activeShifts()) {
        auto o = new juce::DynamicObject();
        o->setProperty("dimension", juce::String(StateEngine::dimensionName(s.dimension)));
        o->setProperty("start", (double)s.startValue);
        o->setProperty("end", (double)s.endValue);
        o->setProperty("duration", (double)s.duration);
        o->setProperty("elapsed", (double)s.elapsed);
        o->setProperty("feedback", s.isFeedback);
        shifts.add(juce::var(o));
    }
    root->setProperty("shifts", shifts);

    return juce::var(root);
}

int restore(StateEngine& engine, const juce::var& snapshot)
{
    auto* dims = snapshot.getProperty("dimensions", {}).getArray();
    if (!dims) return 0;

    int restored = 0;
    for (auto& d : *dims) {
        if (!d.isObject()) continue;
        auto name = d.getProperty("name", "").toString().toStdString();
        auto value = d.getProperty("current", {});
        if (StateEngine::dimensionIndex(name) == kInvalidDimension)
            continue;
        if (!value.isDouble() && !value.isInt() && !value.isInt64())
            continue;
        engine.setDimensionValue(name, (float)(double)value);
        ++restored;
    }
    return restored;
}

juce::String toJSON(const StateEngine& engine)
{
    return juce::JSON::toString(capture(engine));
}

bool saveToFile(const StateEngine& engine, const juce::File& file)
{
    return file.replaceWithText(toJSON(engine));
}

juce::var loadFromFile(const juce::File& file)
{
    if (!file.existsAsFile())
        return {};
    auto parsed = juce::JSON::parse(file.loadFileAsString());
    return parsed.isObject() ? parsed : juce::var();
}

} // namespace StateSnapshot
} // namespace reflection
