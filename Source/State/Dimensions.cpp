#include "Dimensions.h"
#include <map>
#include <set>

namespace reflection {
namespace Dimensions {

static const std::array<std::string, kDimensionCount>& canonicalNames()
{
    static const std::array<std::string, kDimensionCount> names = {{
        "colorHue1", "colorHue2", "colorHue3", "colorHue4",
        "colorSaturation", "colorBrightness",
        "gradientSpeed", "gradientScale", "gradientComplexity",
        "gradientOffsetX", "gradientOffsetY",
        "colorBlend", "colorContrast", "colorWarmth", "colorDepth", "colorVibrance",

        "displacementX", "displacementY", "displacementStrength", "displacementRadius",
        "displacementRings", "displacementRotation", "displacementWobble", "displacementChromatic",
        "rippleOrigin2X", "rippleOrigin2Y", "rippleOrigin2Strength",
        "rippleOrigin3X", "rippleOrigin3Y", "rippleOrigin3Strength",
        "morphProgress", "morphType",

        "blur", "glow", "vignette", "saturationPost", "brightnessPost", "contrastPost",
        "noiseAmount", "brightnessEvolution",

        "droneBasePitch", "droneMidPitch", "droneHighPitch",
        "droneBaseVolume", "droneMidVolume", "droneHighVolume",
        "filterCutoff", "filterResonance", "reverbAmount", "delayAmount",
        "chorusAmount", "granularDensity",

        "overallIntensity", "overallSpeed", "overallChaos", "overallWarmth",
        "shapeType", "waveDelay", "waveAmplitude", "waveSpeed",
        "edgeSharpness", "minRadius", "shapeRotation", "rotationSpeed"
    }};
    return names;
}

const std::vector<DimensionAlias>& aliases()
{
    static const std::vector<DimensionAlias> table = {
        {"particleSpeed", Dim::WaveDelay},
        {"particleSize",  Dim::WaveAmplitude},
        {"breathingRate", Dim::WaveSpeed},
        {"pulseRate",     Dim::EdgeSharpness},
        {"entropyLevel",  Dim::RotationSpeed},
        {"foldAmount",    Dim::OverallChaos},
        {"invertAmount",  Dim::OverallWarmth},
        {"secondaryWave", Dim::OverallIntensity},
        {"tertiaryWave",  Dim::OverallSpeed},
    };
    return table;
}

static const std::map<std::string, int>& lookupTable()
{
    static const std::map<std::string, int> table = [] {
        std::map<std::string, int> t;
        auto& names = canonicalNames();
        for (int i = 0; i < kDimensionCount; ++i)
            t[names[(size_t)i]] = i;
        for (auto& a : aliases())
            t.emplace(a.name, indexOf(a.target));
        return t;
    }();
    return table;
}

const std::string& nameOf(int index)
{
    static const std::string empty;
    if (index < 0 || index >= kDimensionCount) return empty;
    return canonicalNames()[(size_t)index];
}

int find(const std::string& name)
{
    auto& t = lookupTable();
    auto it = t.find(name);
    return it != t.end() ? it->second : kInvalidDimension;
}

std::vector<std::string> allNames()
{
    std::vector<std::string> out(canonicalNames().begin(), canonicalNames().end());
    for (auto& a : aliases())
        out.push_back(a.name);
    return out;
}

bool validateAliasTable(std::string* problem)
{
    auto fail = [&](const std::string& msg) {
        if (problem) *problem = msg;
        return false;
    };

    std::set<std::string> canonical(canonicalNames().begin(), canonicalNames().end());
    if ((int)canonical.size() != kDimensionCount)
        return fail("duplicate canonical dimension name");

    std::set<std::string> seen;
    for (auto& a : aliases()) {
        std::string name(a.name);
        int idx = indexOf(a.target);
        if (canonical.count(name))
            return fail("alias shadows canonical name: " + name);
        if (!seen.insert(name).second)
            return fail("alias listed twice: " + name);
        if (groupOf(idx) != DimensionGroup::Mood)
            return fail("alias outside the mood block: " + name);
        if (find(name) != idx)
            return fail("alias does not resolve to its cell: " + name);
    }
    return true;
}

} // namespace Dimensions
} // namespace reflection
