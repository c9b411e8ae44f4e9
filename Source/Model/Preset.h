#pragma once

#include <juce_core/juce_core.h>
#include <string>
#include <utility>
#include <vector>

namespace reflection {

class StateEngine;

// Named look: dimension name -> value, applied instantly
struct StatePreset {
    std::string name;
    std::vector<std::pair<std::string, float>> values;

    juce::var toVar() const;
    static StatePreset fromVar(const juce::var& v);
};

// ============================================================
// Preset: JSON load/save + 7 built-in looks from the
// installation's control panel
// ============================================================
namespace Preset {

    const std::vector<StatePreset>& getBuiltIns();

    // Built-in by name, nullptr if unknown
    const StatePreset* find(const std::string& name);

    // Writes every value with setDimensionValue. Unknown names are
    // skipped; returns how many values landed.
    int apply(StateEngine& engine, const StatePreset& preset);
    bool apply(StateEngine& engine, const std::string& builtInName);

    // Current values of every canonical dimension
    StatePreset capture(const StateEngine& engine, const std::string& name);

    // JSON serialization
    juce::String toJSON(const std::vector<StatePreset>& presets);
    std::vector<StatePreset> fromJSON(const juce::String& json);

    // File I/O
    bool saveToFile(const juce::File& file, const std::vector<StatePreset>& presets);
    std::vector<StatePreset> loadFromFile(const juce::File& file);

} // namespace Preset
} // namespace reflection
