#include "Projection.h"

namespace reflection {

juce::var VisualState::toVar() const
{
    auto obj = new juce::DynamicObject();
    obj->setProperty("colorHue1", (double)colorHue1);
    obj->setProperty("colorHue2", (double)colorHue2);
    obj->setProperty("colorHue3", (double)colorHue3);
    obj->setProperty("colorHue4", (double)colorHue4);
    obj->setProperty("colorSaturation", (double)colorSaturation);
    obj->setProperty("colorBrightness", (double)colorBrightness);
    obj->setProperty("colorContrast", (double)colorContrast);
    obj->setProperty("colorWarmth", (double)colorWarmth);

    obj->setProperty("gradientSpeed", (double)gradientSpeed);
    obj->setProperty("gradientScale", (double)gradientScale);
    obj->setProperty("gradientComplexity", (double)gradientComplexity);
    obj->setProperty("gradientOffsetX", (double)gradientOffsetX);
    obj->setProperty("gradientOffsetY", (double)gradientOffsetY);
    obj->setProperty("colorDropSpeed", (double)colorDropSpeed);
    obj->setProperty("colorDropSpread", (double)colorDropSpread);
    obj->setProperty("colorMixIntensity", (double)colorMixIntensity);

    obj->setProperty("displacementX", (double)displacementX);
    obj->setProperty("displacementY", (double)displacementY);
    obj->setProperty("displacementStrength", (double)displacementStrength);
    obj->setProperty("displacementRadius", (double)displacementRadius);
    obj->setProperty("displacementRings", displacementRings);
    obj->setProperty("displacementRotation", (double)displacementRotation);
    obj->setProperty("displacementWobble", (double)displacementWobble);
    obj->setProperty("displacementChromatic", (double)displacementChromatic);
    obj->setProperty("focusIntensity", (double)focusIntensity);

    obj->setProperty("rippleOrigin2X", (double)rippleOrigin2X);
    obj->setProperty("rippleOrigin2Y", (double)rippleOrigin2Y);
    obj->setProperty("rippleOrigin2Strength", (double)rippleOrigin2Strength);
    obj->setProperty("rippleOrigin3X", (double)rippleOrigin3X);
    obj->setProperty("rippleOrigin3Y", (double)rippleOrigin3Y);
    obj->setProperty("rippleOrigin3Strength", (double)rippleOrigin3Strength);

    obj->setProperty("shapeType", (double)shapeType);
    obj->setProperty("waveDelay", (double)waveDelay);
    obj->setProperty("waveAmplitude", (double)waveAmplitude);
    obj->setProperty("waveSpeed", (double)waveSpeed);
    obj->setProperty("edgeSharpness", (double)edgeSharpness);
    obj->setProperty("minRadius", (double)minRadius);
    obj->setProperty("shapeRotation", (double)shapeRotation);
    obj->setProperty("rotationSpeed", (double)rotationSpeed);
    obj->setProperty("foldAmount", (double)foldAmount);
    obj->setProperty("invertAmount", (double)invertAmount);
    obj->setProperty("secondaryWave", (double)secondaryWave);
    obj->setProperty("tertiaryWave", (double)tertiaryWave);

    obj->setProperty("morphProgress", (double)morphProgress);
    obj->setProperty("morphType", morphType);

    obj->setProperty("blur", (double)blur);
    obj->setProperty("glow", (double)glow);
    obj->setProperty("vignette", (double)vignette);
    obj->setProperty("vignetteShape", (double)vignetteShape);
    obj->setProperty("saturationPost", (double)saturationPost);
    obj->setProperty("brightnessPost", (double)brightnessPost);
    obj->setProperty("contrastPost", (double)contrastPost);
    obj->setProperty("noiseAmount", (double)noiseAmount);
    obj->setProperty("brightnessEvolution", (double)brightnessEvolution);

    obj->setProperty("particleSpeed", (double)particleSpeed);
    obj->setProperty("particleSize", (double)particleSize);
    obj->setProperty("overallIntensity", (double)overallIntensity);
    obj->setProperty("breathingRate", (double)breathingRate);
    obj->setProperty("pulseRate", (double)pulseRate);
    return juce::var(obj);
}

juce::var AudioState::toVar() const
{
    auto obj = new juce::DynamicObject();
    obj->setProperty("audioVolume", (double)audioVolume);
    obj->setProperty("audioBass", (double)audioBass);
    obj->setProperty("audioMid", (double)audioMid);
    obj->setProperty("audioHigh", (double)audioHigh);
    obj->setProperty("audioFilterBase", (double)audioFilterBase);
    obj->setProperty("audioFilterMid", (double)audioFilterMid);
    obj->setProperty("audioFilterHigh", (double)audioFilterHigh);
    obj->setProperty("audioReverb", (double)audioReverb);
    obj->setProperty("audioDelay", (double)audioDelay);
    obj->setProperty("audioModulation", (double)audioModulation);
    obj->setProperty("audioGrain", (double)audioGrain);

    obj->setProperty("droneBasePitch", (double)droneBasePitch);
    obj->setProperty("droneMidPitch", (double)droneMidPitch);
    obj->setProperty("droneHighPitch", (double)droneHighPitch);
    obj->setProperty("filterCutoff", (double)filterCutoff);
    obj->setProperty("filterResonance", (double)filterResonance);
    obj->setProperty("reverbAmount", (double)reverbAmount);
    obj->setProperty("delayAmount", (double)delayAmount);
    obj->setProperty("chorusAmount", (double)chorusAmount);
    obj->setProperty("granularDensity", (double)granularDensity);
    return juce::var(obj);
}

} // namespace reflection
