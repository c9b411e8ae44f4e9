#pragma once

#include "SessionRandom.h"
#include <map>
#include <vector>

namespace reflection {

struct KeyInfluence {
    int dimension = 0;
    float strength = 0.0f;   // signed
};

// ============================================================
// KeyMappings: per-session random association from a key to
// a handful of dimensions, plus row-structured overlays:
//   digits      -> audio (40-51)
//   qwerty row  -> color (0-15)
//   home row    -> displacement (16-31)
//   bottom row  -> mood (52-63)
// ============================================================
class KeyMappings {
public:
    static constexpr const char* kAlphabet = "qwertyuiopasdfghjklzxcvbnm1234567890";

    void build(SessionRandom& rng);

    // Case-insensitive; nullptr for unmapped symbols
    const std::vector<KeyInfluence>* find(char key) const;

    int size() const { return (int)table_.size(); }
    const std::map<char, std::vector<KeyInfluence>>& table() const { return table_; }

private:
    std::map<char, std::vector<KeyInfluence>> table_;
};

} // namespace reflection
