#include "ConnectionGraph.h"

namespace reflection {

namespace {

struct CuratedEdge {
    Dim source;
    Dim target;
    float strength;
};

// Aliased cells appear under their canonical dimension
// (particleSpeed = WaveDelay, breathingRate = WaveSpeed,
//  pulseRate = EdgeSharpness, entropyLevel = RotationSpeed).
const CuratedEdge kCurated[] = {
    // Color
    {Dim::ColorHue1,            Dim::ColorHue2,             0.15f},
    {Dim::ColorHue2,            Dim::ColorHue3,             0.12f},
    {Dim::ColorHue3,            Dim::ColorHue4,             0.1f},
    {Dim::ColorSaturation,      Dim::ColorVibrance,         0.3f},
    {Dim::ColorBrightness,      Dim::Glow,                  0.2f},
    {Dim::ColorWarmth,          Dim::ColorHue1,             0.1f},

    // Displacement
    {Dim::DisplacementStrength, Dim::DisplacementChromatic, 0.25f},
    {Dim::DisplacementRings,    Dim::DisplacementWobble,   -0.1f},
    {Dim::OverallIntensity,     Dim::DisplacementStrength,  0.25f},
    {Dim::DisplacementX,        Dim::RippleOrigin2X,       -0.15f},
    {Dim::DisplacementY,        Dim::RippleOrigin2Y,       -0.15f},

    // Audio <-> visual
    {Dim::DroneBaseVolume,      Dim::DisplacementStrength,  0.1f},
    {Dim::FilterCutoff,         Dim::ColorBrightness,       0.15f},
    {Dim::ReverbAmount,         Dim::Blur,                  0.2f},
    {Dim::OverallIntensity,     Dim::DroneBaseVolume,       0.15f},

    // Chaos spreads
    {Dim::OverallChaos,         Dim::DisplacementWobble,    0.2f},
    {Dim::OverallChaos,         Dim::GranularDensity,       0.15f},
    {Dim::OverallChaos,         Dim::NoiseAmount,           0.1f},
    {Dim::RotationSpeed,        Dim::OverallChaos,          0.08f},

    // Speed
    {Dim::OverallSpeed,         Dim::GradientSpeed,         0.35f},
    {Dim::OverallSpeed,         Dim::WaveDelay,             0.3f},
    {Dim::WaveSpeed,            Dim::EdgeSharpness,         0.2f},

    // Cross-modal
    {Dim::ColorWarmth,          Dim::OverallWarmth,         0.3f},
    {Dim::OverallWarmth,        Dim::DroneBasePitch,       -0.1f},
};

} // namespace

int ConnectionGraph::curatedCount()
{
    return (int)(sizeof(kCurated) / sizeof(kCurated[0]));
}

void ConnectionGraph::add(Dim source, Dim target, float strength)
{
    add(indexOf(source), indexOf(target), strength);
}

void ConnectionGraph::add(int source, int target, float strength)
{
    if (source < 0 || source >= kDimensionCount || target < 0 || target >= kDimensionCount)
        return;
    edges_.push_back({source, target, strength});
}

void ConnectionGraph::build(SessionRandom& rng, const std::set<int>& staticDims, int randomCount)
{
    edges_.clear();
    for (auto& e : kCurated)
        add(e.source, e.target, e.strength);

    // Resample rejected pairs so the random share is always exactly randomCount
    int added = 0;
    while (added < randomCount) {
        int source = rng.index(kDimensionCount);
        int target = rng.index(kDimensionCount);
        if (source == target || staticDims.count(source) || staticDims.count(target))
            continue;
        float strength = (rng.uniform() - 0.5f) * 0.08f;
        edges_.push_back({source, target, strength});
        ++added;
    }
}

void ConnectionGraph::accumulate(const std::array<float, kDimensionCount>& current,
                                 const std::array<float, kDimensionCount>& autoFactors,
                                 float dt, float gain,
                                 std::array<float, kDimensionCount>& out) const
{
    for (auto& e : edges_) {
        float af = autoFactors[(size_t)e.target];
        if (af <= 0.0f) continue;
        float deviation = current[(size_t)e.source] - 0.5f;
        out[(size_t)e.target] += deviation * e.strength * dt * gain * af;
    }
}

} // namespace reflection
