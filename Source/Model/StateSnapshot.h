#pragma once

#include <juce_core/juce_core.h>

namespace reflection {

class StateEngine;

// ============================================================
// StateSnapshot: debug/introspection dump of a running engine
// and restoration of its observable values.
// ============================================================
namespace StateSnapshot {

    // {time, seed, harmony, focus{...}, dimensions[64]{...}, shifts[...]}
    juce::var capture(const StateEngine& engine);

    // Re-applies current values by name via setDimensionValue.
    // Home values and session randomness are not touched.
    // Returns the number of dimensions restored.
    int restore(StateEngine& engine, const juce::var& snapshot);

    juce::String toJSON(const StateEngine& engine);
    bool saveToFile(const StateEngine& engine, const juce::File& file);
    juce::var loadFromFile(const juce::File& file);

} // namespace StateSnapshot
} // namespace reflection
