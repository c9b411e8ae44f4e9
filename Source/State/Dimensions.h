#pragma once

#include <array>
#include <string>
#include <vector>

namespace reflection {

// ============================================================
// Dimension layout: 64 scalar channels, fixed for the session
//   0-15  color / gradient
//  16-31  displacement
//  32-39  post-processing
//  40-51  audio synthesis
//  52-63  global mood + shape/wave controls
// ============================================================
enum class Dim : int {
    ColorHue1 = 0, ColorHue2, ColorHue3, ColorHue4,
    ColorSaturation, ColorBrightness,
    GradientSpeed, GradientScale, GradientComplexity,
    GradientOffsetX, GradientOffsetY,
    ColorBlend, ColorContrast, ColorWarmth, ColorDepth, ColorVibrance,

    DisplacementX = 16, DisplacementY, DisplacementStrength, DisplacementRadius,
    DisplacementRings, DisplacementRotation, DisplacementWobble, DisplacementChromatic,
    RippleOrigin2X, RippleOrigin2Y, RippleOrigin2Strength,
    RippleOrigin3X, RippleOrigin3Y, RippleOrigin3Strength,
    MorphProgress, MorphType,

    Blur = 32, Glow, Vignette, SaturationPost, BrightnessPost, ContrastPost,
    NoiseAmount, BrightnessEvolution,

    DroneBasePitch = 40, DroneMidPitch, DroneHighPitch,
    DroneBaseVolume, DroneMidVolume, DroneHighVolume,
    FilterCutoff, FilterResonance, ReverbAmount, DelayAmount,
    ChorusAmount, GranularDensity,

    OverallIntensity = 52, OverallSpeed, OverallChaos, OverallWarmth,
    ShapeType, WaveDelay, WaveAmplitude, WaveSpeed,
    EdgeSharpness, MinRadius, ShapeRotation, RotationSpeed
};

constexpr int kDimensionCount = 64;
constexpr int kInvalidDimension = -1;

constexpr int indexOf(Dim d) { return static_cast<int>(d); }

// Hue channels are circular; everything else is soft-clamped
constexpr bool isHueDimension(int index) { return index >= 0 && index <= 3; }

enum class DimensionGroup { Color, Displacement, Post, Audio, Mood };

constexpr DimensionGroup groupOf(int index)
{
    if (index < 16) return DimensionGroup::Color;
    if (index < 32) return DimensionGroup::Displacement;
    if (index < 40) return DimensionGroup::Post;
    if (index < 52) return DimensionGroup::Audio;
    return DimensionGroup::Mood;
}

// Secondary names sharing a cell with a canonical dimension.
// Writing one mutates the other; callers treat them as mutually exclusive.
struct DimensionAlias {
    const char* name;
    Dim target;
};

namespace Dimensions {

    // Canonical name for an index ("" if out of range)
    const std::string& nameOf(int index);
    inline const std::string& nameOf(Dim d) { return nameOf(indexOf(d)); }

    // Canonical names and aliases resolve; unknown names give kInvalidDimension
    int find(const std::string& name);

    const std::vector<DimensionAlias>& aliases();

    // Every name known to the engine (canonical first, then aliases)
    std::vector<std::string> allNames();

    // Startup consistency check: aliases must land inside the mood block,
    // must not shadow a canonical name, and must be unique.
    bool validateAliasTable(std::string* problem = nullptr);

} // namespace Dimensions
} // namespace reflection
