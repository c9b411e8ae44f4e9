#pragma once

#include "Dimensions.h"
#include "SessionRandom.h"
#include <array>
#include <set>
#include <vector>

namespace reflection {

// Directed linear coupling: source deviation from 0.5 nudges target
struct Connection {
    int source = 0;
    int target = 0;
    float strength = 0.0f;   // -1 .. 1
};

// ============================================================
// ConnectionGraph: fixed after construction; cycles allowed,
// damped downstream by smoothing.
// ============================================================
class ConnectionGraph {
public:
    ConnectionGraph() = default;

    // Curated edges + `randomCount` weak random edges (|s| < 0.04).
    // Self-loops and static endpoints are never generated.
    void build(SessionRandom& rng, const std::set<int>& staticDims, int randomCount);

    void add(Dim source, Dim target, float strength);
    void add(int source, int target, float strength);
    void clear() { edges_.clear(); }

    const std::vector<Connection>& edges() const { return edges_; }
    int size() const { return (int)edges_.size(); }

    // Per-frame coupling buffer. Edges whose target has autoFactor 0
    // contribute nothing.
    void accumulate(const std::array<float, kDimensionCount>& current,
                    const std::array<float, kDimensionCount>& autoFactors,
                    float dt, float gain,
                    std::array<float, kDimensionCount>& out) const;

    static int curatedCount();

private:
    std::vector<Connection> edges_;
};

} // namespace reflection
