#include "Preset.h"
#include "../State/StateEngine.h"

namespace reflection {

juce::var StatePreset::toVar() const
{
    auto valuesObj = new juce::DynamicObject();
    for (auto& kv : values)
        valuesObj->setProperty(juce::Identifier(juce::String(kv.first)), (double)kv.second);

    auto obj = new juce::DynamicObject();
    obj->setProperty("name", juce::String(name));
    obj->setProperty("values", juce::var(valuesObj));
    return juce::var(obj);
}

StatePreset StatePreset::fromVar(const juce::var& v)
{
    StatePreset p;
    p.name = v.getProperty("name", "").toString().toStdString();

    if (auto* obj = v.getProperty("values", {}).getDynamicObject()) {
        for (auto& prop : obj->getProperties()) {
            if (!prop.value.isDouble() && !prop.value.isInt() && !prop.value.isInt64())
                continue;
            p.values.push_back({prop.name.toString().toStdString(), (float)(double)prop.value});
        }
    }
    return p;
}

namespace Preset {

// Shared slider set of the control panel, in panel order
static StatePreset makeLook(const std::string& name,
                            float hue1, float hue2, float sat, float bright,
                            float strength, float radius, float rings,
                            float centerX, float centerY, float chromatic, float wobble,
                            float ripple2, float ripple3, float morph,
                            float blur, float glow, float vignette)
{
    StatePreset p;
    p.name = name;
    p.values = {
        {"colorHue1", hue1}, {"colorHue2", hue2},
        {"colorSaturation", sat}, {"colorBrightness", bright},
        {"displacementStrength", strength}, {"displacementRadius", radius},
        {"displacementRings", rings},
        {"displacementX", centerX}, {"displacementY", centerY},
        {"displacementChromatic", chromatic}, {"displacementWobble", wobble},
        {"rippleOrigin2Strength", ripple2}, {"rippleOrigin3Strength", ripple3},
        {"morphProgress", morph},
        {"blur", blur}, {"glow", glow}, {"vignette", vignette},
    };
    return p;
}

const std::vector<StatePreset>& getBuiltIns()
{
    static const std::vector<StatePreset> presets = [] {
        std::vector<StatePreset> v;
        v.push_back(makeLook("calm",       0.55f, 0.5f,  0.5f, 0.55f, 0.4f, 0.6f, 0.4f,  0.5f, 0.5f, 0.3f, 0.2f,  0.0f, 0.0f,  0.0f, 0.4f, 0.3f, 0.3f));
        v.push_back(makeLook("softBlobs",  0.5f,  0.85f, 0.7f, 0.6f,  0.2f, 0.4f, 0.15f, 0.3f, 0.4f, 0.4f, 0.5f,  0.3f, 0.2f,  0.0f, 0.8f, 0.5f, 0.2f));
        v.push_back(makeLook("singleRing", 0.9f,  0.85f, 0.8f, 0.6f,  0.6f, 0.7f, 0.1f,  0.5f, 0.5f, 0.5f, 0.1f,  0.0f, 0.0f,  0.0f, 0.1f, 0.2f, 0.5f));
        v.push_back(makeLook("multiRings", 0.55f, 0.1f,  0.9f, 0.55f, 0.5f, 0.9f, 0.6f,  0.5f, 0.5f, 0.6f, 0.15f, 0.4f, 0.3f,  0.0f, 0.2f, 0.3f, 0.3f));
        v.push_back(makeLook("chromatic",  0.0f,  0.33f, 1.0f, 0.6f,  0.7f, 1.0f, 0.8f,  0.5f, 0.5f, 1.0f, 0.1f,  0.2f, 0.15f, 0.0f, 0.1f, 0.4f, 0.2f));

        // angular also picks a morph type
        auto angular = makeLook("angular", 0.95f, 0.45f, 0.85f, 0.5f, 0.5f, 0.8f, 0.5f, 0.5f, 0.5f, 0.3f, 0.0f, 0.0f, 0.0f, 0.8f, 0.0f, 0.3f, 0.4f);
        angular.values.insert(angular.values.begin() + 14, {"morphType", 0.5f});
        v.push_back(angular);

        v.push_back(makeLook("minimal",    0.6f,  0.58f, 0.3f, 0.7f,  0.2f, 0.5f, 0.25f, 0.5f, 0.5f, 0.1f, 0.05f, 0.0f, 0.0f,  0.0f, 0.5f, 0.1f, 0.5f));
        return v;
    }();
    return presets;
}

const StatePreset* find(const std::string& name)
{
    for (auto& p : getBuiltIns())
        if (p.name == name) return &p;
    return nullptr;
}

int apply(StateEngine& engine, const StatePreset& preset)
{
    int applied = 0;
    for (auto& kv : preset.values) {
        if (StateEngine::dimensionIndex(kv.first) == kInvalidDimension) {
            DBG("[preset] " << juce::String(preset.name) << ": unknown dimension " << juce::String(kv.first));
            continue;
        }
        engine.setDimensionValue(kv.first, kv.second);
        ++applied;
    }
    DBG("[preset] applied " << juce::String(preset.name) << " (" << applied << " values)");
    return applied;
}

bool apply(StateEngine& engine, const std::string& builtInName)
{
    auto* p = find(builtInName);
    if (p == nullptr) {
        DBG("[preset] no built-in named " << juce::String(builtInName));
        return false;
    }
    apply(engine, *p);
    return true;
}

StatePreset capture(const StateEngine& engine, const std::string& name)
{
    StatePreset p;
    p.name = name;
    for (int i = 0; i < kDimensionCount; ++i)
        p.values.push_back({StateEngine::dimensionName(i), engine.current(i)});
    return p;
}

juce::String toJSON(const std::vector<StatePreset>& presets)
{
    juce::Array<juce::var> arr;
    for (auto& p : presets)
        arr.add(p.toVar());

    auto root = new juce::DynamicObject();
    root->setProperty("presets", arr);
    return juce::JSON::toString(juce::var(root));
}

std::vector<StatePreset> fromJSON(const juce::String& json)
{
    std::vector<StatePreset> presets;

    auto parsed = juce::JSON::parse(json);
    if (!parsed.isObject()) return presets;

    auto* arr = parsed.getProperty("presets", {}).getArray();
    if (!arr) return presets;

    for (auto& item : *arr) {
        if (!item.isObject()) continue;
        auto p = StatePreset::fromVar(item);
        if (p.name.empty()) continue;
        presets.push_back(std::move(p));
    }
    return presets;
}

bool saveToFile(const juce::File& file, const std::vector<StatePreset>& presets)
{
    return file.replaceWithText(toJSON(presets));
}

std::vector<StatePreset> loadFromFile(const juce::File& file)
{
    if (!file.existsAsFile()) {
        DBG("[preset] missing file " << file.getFullPathName());
        return {};
    }
    return fromJSON(file.loadFileAsString());
}

} // namespace Preset
} // namespace reflection
