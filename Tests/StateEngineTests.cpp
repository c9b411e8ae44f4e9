// Automated tests for the state engine, its overrides, presets and host session
// Compile: cmake --build build --target ReflectionTests
// Run:     ./build/ReflectionTests_artefacts/Release/Reflection\ Tests

#include <juce_core/juce_core.h>
#include "../Source/State/StateEngine.h"
#include "../Source/Model/EngineConfig.h"
#include "../Source/Model/Preset.h"
#include "../Source/Model/StateSnapshot.h"
#include "../Source/Input/InputQueue.h"
#include "../Source/Input/FaceSmoother.h"
#include "../Source/Host/Session.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <thread>
#include <vector>

using namespace reflection;

static int passed = 0, failed = 0;

#define CHECK(cond, msg) do { \
    if (cond) { ++passed; } \
    else { ++failed; fprintf(stderr, "FAIL: %s\n", msg); } \
} while(0)

#define CHECK_EQ(a, b, msg) do { \
    if ((a) == (b)) { ++passed; } \
    else { ++failed; fprintf(stderr, "FAIL: %s (got %d, expected %d)\n", msg, (int)(a), (int)(b)); } \
} while(0)

#define CHECK_NEAR(a, b, tol, msg) do { \
    if (std::abs((a) - (b)) <= (tol)) { ++passed; } \
    else { ++failed; fprintf(stderr, "FAIL: %s (got %f, expected %f, tol %f)\n", msg, (double)(a), (double)(b), (double)(tol)); } \
} while(0)

static const float kFrame = 1.0f / 60.0f;

static void run(StateEngine& e, int frames, float dt = kFrame)
{
    for (int i = 0; i < frames; ++i)
        e.update(dt);
}

// Config with every random spawn switched off
static EngineConfig quietConfig(uint32_t seed)
{
    EngineConfig c;
    c.seed = seed;
    c.shiftSpawnChance = 0.0f;
    c.feedbackSpawnChance = 0.0f;
    return c;
}

// ============================================================
// Test 1: Dimension table, names and aliases
// ============================================================
static void testDimensionLayout()
{
    fprintf(stdout, "--- Test: dimension layout ---\n");

    CHECK_EQ(StateEngine::dimensionCount(), 64, "64 dimensions");
    CHECK_EQ(StateEngine::dimensionIndex("colorHue1"), 0, "colorHue1 is index 0");
    CHECK_EQ(StateEngine::dimensionIndex("displacementX"), 16, "displacementX is index 16");
    CHECK_EQ(StateEngine::dimensionIndex("blur"), 32, "blur is index 32");
    CHECK_EQ(StateEngine::dimensionIndex("droneBasePitch"), 40, "droneBasePitch is index 40");
    CHECK_EQ(StateEngine::dimensionIndex("overallIntensity"), 52, "overallIntensity is index 52");
    CHECK_EQ(StateEngine::dimensionIndex("rotationSpeed"), 63, "rotationSpeed is index 63");
    CHECK_EQ(StateEngine::dimensionIndex("nope"), kInvalidDimension, "unknown name gives -1");
    CHECK(StateEngine::dimensionName(99).empty(), "out-of-range index has empty name");

    // Every canonical name resolves back to its own index
    bool allRoundTrip = true;
    std::set<std::string> unique;
    for (int i = 0; i < kDimensionCount; ++i) {
        auto& n = StateEngine::dimensionName(i);
        unique.insert(n);
        if (StateEngine::dimensionIndex(n) != i) allRoundTrip = false;
    }
    CHECK(allRoundTrip, "canonical names resolve to their index");
    CHECK_EQ((int)unique.size(), 64, "canonical names are unique");

    std::string problem;
    CHECK(Dimensions::validateAliasTable(&problem), "alias table validates");
    CHECK_EQ((int)Dimensions::aliases().size(), 9, "9 aliases");
    CHECK_EQ((int)Dimensions::allNames().size(), 73, "73 names including aliases");

    CHECK_EQ(StateEngine::dimensionIndex("particleSpeed"), indexOf(Dim::WaveDelay), "particleSpeed aliases waveDelay");
    CHECK_EQ(StateEngine::dimensionIndex("foldAmount"), indexOf(Dim::OverallChaos), "foldAmount aliases overallChaos");

    // Aliased names share storage
    StateEngine e(42u);
    e.setDimensionValue("particleSpeed", 0.123f);
    CHECK(e.get("waveDelay") == 0.123f, "writing alias mutates canonical cell");
    e.setDimensionValue("overallChaos", 0.77f);
    CHECK(e.get("foldAmount") == 0.77f, "writing canonical is visible through alias");

    CHECK(isHueDimension(0) && isHueDimension(3), "hues are circular");
    CHECK(!isHueDimension(4), "saturation is not circular");
    CHECK(groupOf(45) == DimensionGroup::Audio, "45 is in the audio block");
}

// ============================================================
// Test 2: Fresh engine invariants
// ============================================================
static void testInitialization()
{
    fprintf(stdout, "--- Test: initialization ---\n");
    StateEngine e(1234u);

    CHECK_EQ((int)e.seed(), 1234, "seed is kept");
    CHECK_EQ(e.connections().size(), ConnectionGraph::curatedCount() + 15, "curated + 15 random connections");
    CHECK_EQ(ConnectionGraph::curatedCount(), 24, "24 curated connections");
    CHECK_EQ(e.keyMappings().size(), 36, "36 mapped keys");
    CHECK(e.time() == 0.0, "time starts at zero");

    bool homeMatches = true, targetMatches = true;
    for (int i = 0; i < kDimensionCount; ++i) {
        if (e.homeValue(i) != e.current(i)) homeMatches = false;
        if (e.target(i) != e.current(i)) targetMatches = false;
    }
    CHECK(homeMatches, "home values equal initial current values");
    CHECK(targetMatches, "targets start at current values");

    for (int i = 0; i < 4; ++i)
        CHECK(e.current(i) >= 0.0f && e.current(i) < 1.0f, "initial hue in [0,1)");

    CHECK(e.get("colorSaturation") >= 0.82f && e.get("colorSaturation") <= 0.94f, "saturation drawn from [0.82,0.94]");
    CHECK(e.get("colorBrightness") >= 0.58f && e.get("colorBrightness") <= 0.66f, "brightness drawn from [0.58,0.66]");

    CHECK(e.get("vignette") == 0.0f, "vignette starts at 0");
    CHECK(e.get("waveDelay") == 0.65f, "waveDelay default");
    CHECK(e.get("droneBaseVolume") == 0.625f, "drone base volume default");
    CHECK(e.get("filterCutoff") == 0.16f, "filter cutoff default");
    CHECK(e.get("overallIntensity") == 0.5f, "unlisted dimensions start at 0.5");

    CHECK(e.isStatic(indexOf(Dim::Vignette)), "vignette is static");
    CHECK_EQ((int)e.staticDimensions().size(), 1, "one static dimension");

    bool smoothingOk = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (e.smoothing(i) < 0.995f || e.smoothing(i) > 0.999f) smoothingOk = false;
    CHECK(smoothingOk, "smoothing coefficients in [0.995,0.999]");

    CHECK(!e.focusMode().isActive(), "focus starts inactive");
    CHECK(e.focusMode().nextTransition() >= 10.0 && e.focusMode().nextTransition() <= 30.0, "first focus in 10-30s");
    CHECK(e.activeShifts().empty(), "no shifts at start");

    CHECK(e.get("unknownThing") == 0.0f, "unknown name reads 0");
    CHECK(e.current(-1) == 0.0f && e.current(64) == 0.0f, "out-of-range index reads 0");
}

// ============================================================
// Test 3: Palette harmony rules
// ============================================================
static void testComplementaryHarmony()
{
    fprintf(stdout, "--- Test: complementary harmony ---\n");

    bool found = false;
    for (uint32_t seed = 1; seed < 400 && !found; ++seed) {
        StateEngine e(seed);
        if (e.harmony() != StateEngine::Harmony::Complementary)
            continue;
        found = true;

        float h1 = e.get("colorHue1");
        float h2 = e.get("colorHue2");
        float expected = std::fmod(h1 + 0.5f, 1.0f);
        float d = std::abs(h2 - expected);
        d = std::min(d, 1.0f - d);
        CHECK(d <= 0.0501f, "complementary hue2 within 0.05 of hue1 + 0.5");
        CHECK(juce::String(StateEngine::harmonyName(e.harmony())) == "complementary", "harmony name");
    }
    CHECK(found, "some seed produces a complementary palette");

    StateEngine a(5u), b(5u), c(6u);
    CHECK(a.get("colorHue1") == b.get("colorHue1"), "same seed, same palette");
    CHECK(a.get("colorHue1") != c.get("colorHue1"), "different seed, different palette");
}

// ============================================================
// Test 4: Connection graph structure and coupling
// ============================================================
static void testConnectionGraph()
{
    fprintf(stdout, "--- Test: connection graph ---\n");

    SessionRandom rng(99);
    std::set<int> staticDims = {indexOf(Dim::Vignette)};
    ConnectionGraph g;
    g.build(rng, staticDims, 15);
    CHECK_EQ(g.size(), 39, "24 curated + 15 random edges");

    bool randomOk = true;
    for (size_t i = (size_t)ConnectionGraph::curatedCount(); i < g.edges().size(); ++i) {
        auto& c = g.edges()[i];
        if (c.source == c.target) randomOk = false;
        if (staticDims.count(c.source) || staticDims.count(c.target)) randomOk = false;
        if (std::abs(c.strength) >= 0.04f) randomOk = false;
        if (c.source < 0 || c.source >= 64 || c.target < 0 || c.target >= 64) randomOk = false;
    }
    CHECK(randomOk, "random edges: no self-loops, no static endpoints, weak strength");

    g.add(70, 1, 0.1f);
    g.add(1, -3, 0.1f);
    CHECK_EQ(g.size(), 39, "out-of-range edges are rejected");

    // Coupling: (source - 0.5) * strength * dt * gain
    ConnectionGraph single;
    single.add(Dim::ColorContrast, Dim::NoiseAmount, 0.5f);

    std::array<float, kDimensionCount> current {};
    std::array<float, kDimensionCount> af {};
    std::array<float, kDimensionCount> out {};
    current.fill(0.5f);
    af.fill(1.0f);
    current[(size_t)indexOf(Dim::ColorContrast)] = 1.0f;

    single.accumulate(current, af, kFrame, 0.5f, out);
    CHECK_NEAR(out[(size_t)indexOf(Dim::NoiseAmount)], 0.5f * 0.5f * kFrame * 0.5f, 1e-7f, "edge contribution");

    out.fill(0.0f);
    af[(size_t)indexOf(Dim::NoiseAmount)] = 0.0f;
    single.accumulate(current, af, kFrame, 0.5f, out);
    CHECK(out[(size_t)indexOf(Dim::NoiseAmount)] == 0.0f, "overridden target receives no coupling");
}

// ============================================================
// Test 5: Edge propagation through the full update pipeline
// ============================================================
static void testConnectionPropagation()
{
    fprintf(stdout, "--- Test: connection propagation ---\n");

    // Same seed, same frame; only the extra edge differs
    StateEngine plain(314u), coupled(314u);
    plain.connections().clear();
    coupled.connections().clear();
    coupled.connections().add(Dim::ColorContrast, Dim::NoiseAmount, 0.5f);

    plain.setDimensionValue("colorContrast", 1.0f);
    coupled.setDimensionValue("colorContrast", 1.0f);

    plain.update(kFrame);
    coupled.update(kFrame);

    int b = indexOf(Dim::NoiseAmount);
    float diff = coupled.target(b) - plain.target(b);
    CHECK_NEAR(diff, 0.5f * 0.5f * kFrame * 0.5f, 1e-5f, "target moves by (a-0.5)*s*dt*0.5");
}

// ============================================================
// Test 6: Key mappings
// ============================================================
static void testKeyMappings()
{
    fprintf(stdout, "--- Test: key mappings ---\n");
    StateEngine e(7u);
    auto& km = e.keyMappings();

    bool sizesOk = true, uniqueOk = true;
    for (auto& kv : km.table()) {
        int n = (int)kv.second.size();
        // 5-10 random picks plus one row overlay
        if (n < 6 || n > 11) sizesOk = false;

        std::set<int> seen;
        for (size_t i = 0; i + 1 < kv.second.size(); ++i)
            seen.insert(kv.second[i].dimension);
        if ((int)seen.size() != n - 1) uniqueOk = false;
    }
    CHECK(sizesOk, "each key has 6-11 influences");
    CHECK(uniqueOk, "random picks per key are unique");

    auto* digit = km.find('5');
    CHECK(digit != nullptr, "digit is mapped");
    if (digit) {
        int overlay = digit->back().dimension;
        CHECK(overlay >= 40 && overlay <= 51, "digit overlay targets audio");
    }
    auto* top = km.find('w');
    if (top) CHECK(top->back().dimension >= 0 && top->back().dimension <= 15, "top row overlay targets color");
    auto* home = km.find('g');
    if (home) CHECK(home->back().dimension >= 16 && home->back().dimension <= 31, "home row overlay targets displacement");
    auto* bottom = km.find('m');
    if (bottom) CHECK(bottom->back().dimension >= 52 && bottom->back().dimension <= 63, "bottom row overlay targets mood");

    CHECK(km.find('!') == nullptr, "punctuation is unmapped");
    CHECK(km.find('Q') == km.find('q'), "lookup is case-insensitive");

    // Unmapped key: nothing changes
    e.handleKeyPress('!');
    bool untouched = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (e.influence(i) != 0.0f) untouched = false;
    CHECK(untouched, "unmapped key is a no-op");

    // Pressing only touches influence
    float before = e.current(0);
    e.handleKeyPress('q');
    bool anyInfluence = false;
    for (int i = 0; i < kDimensionCount; ++i)
        if (e.influence(i) != 0.0f) anyInfluence = true;
    CHECK(anyInfluence, "mapped key adds influence");
    CHECK(e.current(0) == before, "key press does not touch current values");

    StateEngine upper(7u), lower(7u);
    upper.handleKeyPress('A');
    lower.handleKeyPress('a');
    bool same = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (upper.influence(i) != lower.influence(i)) same = false;
    CHECK(same, "uppercase key acts like lowercase");
}

// ============================================================
// Test 7: Lock invariance under heavy input
// ============================================================
static void testLockInvariant()
{
    fprintf(stdout, "--- Test: lock invariant ---\n");
    StateEngine e(21u);
    int x = indexOf(Dim::DisplacementX);
    int ox = indexOf(Dim::GradientOffsetX);

    e.lockDimension("displacementX", 0.2f);
    e.lockDimension("gradientOffsetX", 0.3f);
    CHECK(e.overrideMode(x) == OverrideState::Mode::Locked, "mode is locked");

    bool pinned = true;
    for (int f = 0; f < 600; ++f) {
        e.addInfluence("displacementX", 50.0f);
        e.handleMouseMove(1.0f, 1.0f);
        e.update(kFrame);
        if (e.current(x) != 0.2f || e.target(x) != 0.2f || e.velocity(x) != 0.0f)
            pinned = false;
        if (e.current(ox) != 0.3f)
            pinned = false;
    }
    CHECK(pinned, "locked dimensions never move");
    CHECK(e.autoFactor(x) == 0.0f, "locked autoFactor is 0");

    e.unlockDimension("displacementX");
    CHECK(e.overrideMode(x) == OverrideState::Mode::Free, "unlock returns to free");
    e.addInfluence("displacementX", 50.0f);
    run(e, 5);
    CHECK(e.current(x) != 0.2f, "unlocked dimension moves again");

    // Unknown names and bad values are ignored
    e.lockDimension("notADimension", 0.5f);
    e.lockDimension("blur", std::numeric_limits<float>::quiet_NaN());
    CHECK(e.overrideMode(indexOf(Dim::Blur)) == OverrideState::Mode::Free, "NaN lock ignored");

    // Out-of-range pins are stored the way wrapValues() would leave them
    StateEngine w(quietConfig(31u));
    w.lockDimension("colorHue1", 1.3f);
    w.lockDimension("blur", 1.5f);
    w.setManualValue("glow", -0.4f);
    float hue = w.get("colorHue1");
    CHECK_NEAR(hue, 0.3f, 1e-5f, "hue pin wraps into [0,1)");
    CHECK(w.get("blur") == 1.0f, "pin above range clamps to 1");
    CHECK(w.get("glow") == 0.0f, "manual value below range clamps to 0");
    bool stable = true;
    for (int f = 0; f < 120; ++f) {
        w.update(kFrame);
        if (w.get("colorHue1") != hue || w.get("blur") != 1.0f || w.get("glow") != 0.0f)
            stable = false;
        if (w.target(indexOf(Dim::Blur)) != 1.0f)
            stable = false;
    }
    CHECK(stable, "pinned values read back unchanged across updates");
}

// ============================================================
// Test 8: Manual hold and release
// ============================================================
static void testManualHold()
{
    fprintf(stdout, "--- Test: manual hold ---\n");
    StateEngine e(8u);
    int glow = indexOf(Dim::Glow);

    e.setManualValue("glow", 0.9f);
    CHECK(e.get("glow") == 0.9f, "manual value applied immediately");
    CHECK(e.overrideMode(glow) == OverrideState::Mode::Held, "dimension is held");

    bool held = true;
    for (int f = 0; f < 300; ++f) {
        e.handleBlink();
        e.update(kFrame);
        if (e.get("glow") != 0.9f) held = false;
    }
    CHECK(held, "held value is exact for the first 5 seconds");
    CHECK(e.autoFactor(glow) == 0.0f, "held autoFactor is 0");

    // Hold is at most 60s and release at most 60s
    e.update(130.0f);
    CHECK(e.autoFactor(glow) == 1.0f, "autoFactor back to 1 after hold + release");
    CHECK(e.overrideMode(glow) == OverrideState::Mode::Free, "mode back to free");

    // Slider gesture: target only, no hold
    e.setTargetValue("glow", 0.1f);
    CHECK(e.target(glow) == 0.1f, "target set");
    CHECK(e.overrideMode(glow) == OverrideState::Mode::Free, "target set does not hold");
}

// ============================================================
// Test 9: OverrideState machine
// ============================================================
static void testOverrideState()
{
    fprintf(stdout, "--- Test: override state ---\n");
    OverrideState o;
    CHECK(o.mode(0.0) == OverrideState::Mode::Free, "starts free");
    CHECK(o.autoFactor(0.0, 0.08f) == 1.0f, "free autoFactor is 1");

    o.engageHold(0.5f, 0.0, 10.0, 20.0);
    CHECK(o.mode(5.0) == OverrideState::Mode::Held, "held before hold end");
    CHECK(o.autoFactor(5.0, 0.08f) == 0.0f, "held autoFactor 0");
    CHECK(o.pinnedValue(5.0) == 0.5f, "pinned to hold value");

    CHECK(o.mode(10.0) == OverrideState::Mode::Releasing, "releasing at hold end");
    CHECK(o.autoFactor(10.0, 0.08f) == 0.0f, "autoFactor 0 at release start");
    CHECK_NEAR(o.autoFactor(20.0, 0.08f), 0.08f + 0.92f * 0.5f, 1e-5f, "smoothstep midpoint");
    CHECK(o.autoFactor(15.0, 0.08f) < o.autoFactor(25.0, 0.08f), "release eases upward");

    o.settle(30.0);
    CHECK(o.mode(30.0) == OverrideState::Mode::Free, "free after release window");
    CHECK(o.releaseDuration() == 0.0, "settle clears release window");

    // Lock wins over hold; unlock reveals the pending hold
    OverrideState p;
    p.engageHold(0.4f, 0.0, 10.0, 10.0);
    p.lock(0.9f);
    CHECK(p.mode(1.0) == OverrideState::Mode::Locked, "lock takes precedence");
    CHECK(p.pinnedValue(1.0) == 0.9f, "pinned to locked value");
    p.unlock();
    CHECK(p.mode(1.0) == OverrideState::Mode::Held, "unlock leaves hold in place");

    CHECK(OverrideState::modeToString(OverrideState::Mode::Releasing) == "releasing", "mode string");
}

// ============================================================
// Test 10: Hue wrap and soft clamp
// ============================================================
static void testBoundaries()
{
    fprintf(stdout, "--- Test: hue wrap and soft clamp ---\n");
    {
        StateEngine e(10u);
        e.setDimensionValue("colorHue1", 1.3f);
        e.update(kFrame);
        CHECK(e.get("colorHue1") >= 0.0f && e.get("colorHue1") < 1.0f, "hue wrapped into [0,1)");
        CHECK_NEAR(e.get("colorHue1"), 0.3f, 0.01f, "1.3 wraps to 0.3");

        e.setDimensionValue("colorHue2", -0.2f);
        e.update(kFrame);
        CHECK_NEAR(e.get("colorHue2"), 0.8f, 0.01f, "-0.2 wraps to 0.8");

        e.setDimensionValue("blur", 5.0f);
        e.update(kFrame);
        CHECK(e.get("blur") == 1.05f, "non-hue current clamped to 1.05");
        CHECK(e.target(indexOf(Dim::Blur)) == 1.0f, "non-hue target clamped to 1");
    }

    // Push everything hard in both directions
    StateEngine e(11u);
    bool inRange = true;
    for (int f = 0; f < 3000; ++f) {
        float sign = (f / 1500) % 2 == 0 ? 1.0f : -1.0f;
        for (int i = 0; i < kDimensionCount; ++i)
            e.addInfluence(StateEngine::dimensionName(i), sign * 100.0f);
        e.update(kFrame);

        for (int i = 0; i < kDimensionCount; ++i) {
            float v = e.current(i);
            if (isHueDimension(i)) {
                if (v < 0.0f || v >= 1.0f) inRange = false;
            } else if (v < -0.05f || v > 1.05f) {
                inRange = false;
            }
        }
    }
    CHECK(inRange, "values stay within soft bounds under extreme influence");

    bool capped = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (std::abs(e.velocity(i)) > e.config().velocityCap + 1e-7f) capped = false;
    CHECK(capped, "velocity never exceeds the cap");
}

// ============================================================
// Test 11: Static dimension stays frozen
// ============================================================
static void testStaticDimension()
{
    fprintf(stdout, "--- Test: static dimension ---\n");
    StateEngine e(12u);
    int v = indexOf(Dim::Vignette);

    for (int f = 0; f < 600; ++f) {
        e.addInfluence("vignette", 10.0f);
        e.update(kFrame);
    }
    CHECK(e.get("vignette") == 0.0f, "vignette unmoved by influence");
    CHECK(e.autoFactor(v) == 0.0f, "static autoFactor is 0");
    CHECK(e.target(v) == e.current(v), "static target follows current");

    // Still directly settable
    e.setDimensionValue("vignette", 0.4f);
    run(e, 60);
    CHECK(e.get("vignette") == 0.4f, "direct write sticks");
}

// ============================================================
// Test 12: Influence decay
// ============================================================
static void testInfluenceDecay()
{
    fprintf(stdout, "--- Test: influence decay ---\n");
    StateEngine e(13u);
    int glow = indexOf(Dim::Glow);

    e.addInfluence("glow", 1.0f);
    e.update(kFrame);
    CHECK_NEAR(e.influence(glow), 0.98f, 1e-5f, "one frame decays by 0.98");

    e.update(0.5f);
    CHECK_NEAR(e.influence(glow), 0.98f * std::pow(0.98f, 30.0f), 1e-5f, "decay scales with dt");

    e.addInfluence("glow", std::numeric_limits<float>::infinity());
    CHECK(std::isfinite(e.influence(glow)), "non-finite influence dropped");

    // Bad frame deltas are ignored
    double t = e.time();
    e.update(-1.0f);
    e.update(std::numeric_limits<float>::quiet_NaN());
    CHECK(e.time() == t, "negative or NaN dt does not advance time");
}

// ============================================================
// Test 13: Input handlers only write influence
// ============================================================
static void testInputHandlers()
{
    fprintf(stdout, "--- Test: input handlers ---\n");
    StateEngine e(14u);

    std::vector<float> before;
    for (int i = 0; i < kDimensionCount; ++i)
        before.push_back(e.current(i));

    e.handleBlink();
    CHECK_NEAR(e.influence(indexOf(Dim::Glow)), 0.25f, 1e-7f, "blink adds glow");
    CHECK_NEAR(e.influence(indexOf(Dim::DisplacementStrength)), 0.15f, 1e-7f, "blink adds strength");

    e.handleMouseMove(0.9f, 0.1f);
    CHECK_NEAR(e.influence(indexOf(Dim::DisplacementX)), 0.004f, 1e-6f, "mouse x drives displacementX");
    CHECK_NEAR(e.influence(indexOf(Dim::DisplacementY)), -0.004f, 1e-6f, "mouse y drives displacementY");

    GestureData pinch;
    pinch.isPinching = true;
    pinch.pinchScale = 0.5f;
    e.handleGestureInput(pinch);
    CHECK_NEAR(e.influence(indexOf(Dim::DisplacementRadius)), -0.05f, 1e-6f, "pinch in shrinks radius");

    float chaos = e.influence(indexOf(Dim::OverallChaos));
    e.handleTalking(false);
    CHECK(e.influence(indexOf(Dim::OverallChaos)) == chaos, "not talking is a no-op");
    e.handleTalking(true);
    CHECK_NEAR(e.influence(indexOf(Dim::OverallChaos)), chaos + 0.02f, 1e-6f, "talking adds chaos");

    FaceFeatures absent;
    float glow = e.influence(indexOf(Dim::Glow));
    e.handleFaceFeatures(absent);
    CHECK(e.influence(indexOf(Dim::Glow)) == glow, "undetected face is a no-op");

    GestureData slowSwipe;
    slowSwipe.swipeVelocityX = 0.005f;
    float offset = e.influence(indexOf(Dim::GradientOffsetX));
    e.handleGestureInput(slowSwipe);
    CHECK(e.influence(indexOf(Dim::GradientOffsetX)) == offset, "swipe below threshold ignored");

    bool untouched = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (e.current(i) != before[(size_t)i]) untouched = false;
    CHECK(untouched, "handlers never write current values");

    StateEngine m(32u);
    m.handleMotion(0.5f, -0.4f, 0.3f);
    CHECK_NEAR(m.influence(indexOf(Dim::GradientOffsetX)), 0.025f, 1e-6f, "tilt x drives gradient offset x");
    CHECK_NEAR(m.influence(indexOf(Dim::GradientOffsetY)), -0.02f, 1e-6f, "tilt y drives gradient offset y");
    CHECK_NEAR(m.influence(indexOf(Dim::OverallChaos)), 0.03f, 1e-6f, "shake drives chaos");

    StateEngine fp(33u);
    int dx = indexOf(Dim::DisplacementX);
    int dy = indexOf(Dim::DisplacementY);
    int dr = indexOf(Dim::DisplacementRadius);
    float ex = (0.8f - fp.current(dx)) * 0.05f;
    float ey = (0.3f - fp.current(dy)) * 0.05f;
    float er = (0.6f - fp.current(dr)) * 0.05f;
    fp.handleFacePosition(0.8f, 0.3f, 0.6f);
    CHECK_NEAR(fp.influence(dx), ex, 1e-6f, "face x pulls displacement x");
    CHECK_NEAR(fp.influence(dy), ey, 1e-6f, "face y pulls displacement y");
    CHECK_NEAR(fp.influence(dr), er, 1e-6f, "face size pulls displacement radius");

    StateEngine sm(34u);
    sm.handleFacePositionSmooth(0.5f, -0.5f, 0.2f);
    CHECK_NEAR(sm.influence(dx), 0.135f, 1e-6f, "push x moves displacement x");
    CHECK_NEAR(sm.influence(indexOf(Dim::Glow)), 0.036f, 1e-6f, "push up raises glow");
    CHECK_NEAR(sm.influence(dy), -0.108f, 1e-6f, "push y moves displacement y");
    CHECK_NEAR(sm.influence(indexOf(Dim::DisplacementStrength)), 0.018f, 1e-6f, "closer face strengthens");
    CHECK_NEAR(sm.influence(dr), -0.0144f, 1e-6f, "closer face tightens radius");
    CHECK_NEAR(sm.influence(indexOf(Dim::DelayAmount)), 0.018f, 1e-6f, "sideways push adds delay");
    CHECK_NEAR(sm.influence(indexOf(Dim::ChorusAmount)), 0.0135f, 1e-6f, "sideways push adds chorus");

    StateEngine ff(35u);
    FaceFeatures face;
    face.detected = true;
    face.headYaw = 0.5f;
    face.mouthOpen = 0.5f;
    face.browFurrow = 0.4f;
    ff.handleFaceFeatures(face);
    CHECK_NEAR(ff.influence(indexOf(Dim::GranularDensity)), 0.06f, 1e-6f, "open mouth thickens grains");
    CHECK_NEAR(ff.influence(indexOf(Dim::ReverbAmount)), 0.04f, 1e-6f, "open mouth adds reverb");
    CHECK_NEAR(ff.influence(indexOf(Dim::FilterResonance)), 0.02f, 1e-6f, "furrow adds resonance");
    CHECK_NEAR(ff.influence(indexOf(Dim::DroneBaseVolume)), 0.032f, 1e-6f, "furrow raises drone base");
    CHECK_NEAR(ff.influence(indexOf(Dim::ShapeRotation)), 0.025f, 1e-6f, "yaw turns the shape");
    CHECK_NEAR(ff.influence(indexOf(Dim::DisplacementX)), 0.095f, 1e-6f, "yaw moves displacement x");

    // Audio: NaN ignored, loud input raises feedback
    StateEngine a(15u);
    a.handleAudioInput(std::numeric_limits<float>::quiet_NaN(), 1.0f, 1.0f, 1.0f);
    CHECK(a.influence(indexOf(Dim::DisplacementStrength)) == 0.0f, "NaN audio frame ignored");
    CHECK(!a.shifts().feedbackActive(), "NaN audio does not trigger feedback");

    a.handleAudioInput(0.05f, 0.05f, 0.05f, 0.05f);
    CHECK(!a.shifts().feedbackActive(), "quiet audio does not trigger feedback");

    a.handleAudioInput(1.0f, 1.0f, 1.0f, 1.0f);
    CHECK(a.shifts().feedbackActive(), "loud audio triggers feedback");
    CHECK_NEAR(a.shifts().feedbackIntensity(), 1.0f, 1e-6f, "feedback intensity from audio mix");
}

// ============================================================
// Test 14: Parameter shifts
// ============================================================
static void testParameterShifts()
{
    fprintf(stdout, "--- Test: parameter shifts ---\n");
    StateEngine e(quietConfig(16u));

    CHECK(e.spawnParameterShift(), "first shift spawns");
    CHECK(e.spawnParameterShift(), "second shift spawns");
    CHECK(!e.spawnParameterShift(), "cap of 2 concurrent shifts");
    CHECK_EQ((int)e.activeShifts().size(), 2, "two active shifts");

    auto& s = e.activeShifts();
    CHECK(s[0].dimension != s[1].dimension, "shifts target distinct dimensions");
    for (auto& shift : s) {
        CHECK(!e.isStatic(shift.dimension), "static dimension never shifted");
        CHECK(shift.duration >= 25.0f && shift.duration <= 70.0f, "regular shift lasts 25-70s");
        if (!isHueDimension(shift.dimension))
            CHECK(shift.endValue >= 0.25f && shift.endValue <= 0.75f, "shift end clamped to [0.25,0.75]");
        CHECK(!shift.isFeedback, "spawned on request, not from feedback");
    }

    for (int i = 0; i < 160; ++i)
        e.update(0.5f);
    CHECK(e.activeShifts().empty(), "shifts retire after their duration");

    // Everything blocked: spawning gives up quietly
    StateEngine blocked(quietConfig(17u));
    for (int i = 0; i < kDimensionCount; ++i)
        blocked.lockDimension(StateEngine::dimensionName(i), 0.5f);
    CHECK(!blocked.spawnParameterShift(), "no shift when every dimension is blocked");
    CHECK(blocked.activeShifts().empty(), "no shift recorded");

    // Feedback intensity keeps its max and decays above threshold
    StateEngine f(quietConfig(18u));
    f.triggerInputFeedback(0.8f);
    f.triggerInputFeedback(0.5f);
    CHECK_NEAR(f.shifts().feedbackIntensity(), 0.8f, 1e-6f, "feedback keeps the max");
    f.update(kFrame);
    CHECK_NEAR(f.shifts().feedbackIntensity(), 0.8f * 0.995f, 1e-5f, "feedback decays per frame");

    // Feedback shifts are shorter and bounded to +-0.075
    bool feedbackShape = true;
    for (uint32_t seed = 40u; seed < 60u; ++seed) {
        StateEngine fb(quietConfig(seed));
        if (!fb.spawnParameterShift(true)) { feedbackShape = false; continue; }
        const auto& shift = fb.activeShifts().back();
        if (!shift.isFeedback) feedbackShape = false;
        if (shift.duration < 10.0f || shift.duration > 30.0f) feedbackShape = false;
        bool unclamped = isHueDimension(shift.dimension)
                      || (shift.startValue >= 0.25f && shift.startValue <= 0.75f);
        if (unclamped && std::abs(shift.endValue - shift.startValue) > 0.075f + 1e-6f)
            feedbackShape = false;
    }
    CHECK(feedbackShape, "feedback shift lasts 10-30s and moves at most 0.075");

    // Eased value
    ParameterShift p;
    p.startValue = 0.2f;
    p.endValue = 0.6f;
    p.duration = 10.0f;
    p.elapsed = 5.0f;
    CHECK_NEAR(p.valueAt(), 0.4f, 1e-5f, "cosine ease midpoint");
    p.elapsed = 20.0f;
    CHECK(p.progress() == 1.0f, "progress clamps at 1");
}

// ============================================================
// Test 15: Focus mode
// ============================================================
static void testFocusMode()
{
    fprintf(stdout, "--- Test: focus mode ---\n");
    EngineConfig cfg = quietConfig(19u);
    cfg.focusFirstMin = cfg.focusFirstMax = 1.0f;
    cfg.focusActiveMin = cfg.focusActiveMax = 2.0f;
    cfg.focusIdleMin = cfg.focusIdleMax = 5.0f;
    StateEngine e(cfg);

    while (e.time() < 1.05)
        e.update(kFrame);
    CHECK(e.focusMode().isActive(), "focus activates on schedule");
    CHECK(e.focusMode().targetIntensity() >= 0.6f && e.focusMode().targetIntensity() < 1.0f, "target intensity in [0.6,1)");
    CHECK(e.focusIntensity() > 0.0f, "intensity eases upward");

    VisualState v = e.getVisualState();
    CHECK_NEAR(v.focusIntensity, e.focusIntensity(), 1e-7f, "projection carries focus intensity");

    while (e.time() < 3.1)
        e.update(kFrame);
    CHECK(!e.focusMode().isActive(), "focus releases after its duration");
    CHECK(e.focusMode().targetIntensity() == 0.0f, "released target is 0");

    e.setFocusMode(true, 0.9f);
    CHECK(e.focusMode().isActive(), "manual focus on");
    CHECK(e.focusMode().targetIntensity() == 0.9f, "manual intensity");

    e.toggleFocusMode();
    CHECK(!e.focusMode().isActive(), "toggle turns focus off");
    CHECK(e.focusMode().targetIntensity() == 0.0f, "toggled off target is 0");
    e.toggleFocusMode();
    CHECK(e.focusMode().isActive(), "toggle turns focus on");
    CHECK(e.focusMode().targetIntensity() >= 0.6f, "toggled on intensity in [0.6,1)");

    // Bad intensities never reach the multiplier
    float held = e.focusMode().targetIntensity();
    e.setFocusMode(true, std::numeric_limits<float>::quiet_NaN());
    CHECK(e.focusMode().targetIntensity() == held, "NaN focus intensity ignored");
    e.setFocusMode(true, 1.7f);
    CHECK(e.focusMode().targetIntensity() == 1.0f, "focus intensity clamped to 1");
    e.setFocusMode(true, -0.5f);
    CHECK(e.focusMode().targetIntensity() == 0.0f, "focus intensity clamped to 0");
    e.setFocusMode(true, 1.7f);
    run(e, 300);
    CHECK(std::isfinite(e.focusIntensity()), "focus intensity stays finite");
    CHECK(e.focusIntensity() <= 1.0f, "focus intensity stays within [0,1]");
    CHECK(std::isfinite(e.getVisualState().displacementStrength), "focused strength stays finite");

    FocusMode direct;
    direct.set(true, 0.5f);
    direct.set(true, std::numeric_limits<float>::infinity());
    CHECK(direct.targetIntensity() == 0.5f, "infinite intensity ignored");
}

// ============================================================
// Test 16: Pendulum bounds
// ============================================================
static void testPendulum()
{
    fprintf(stdout, "--- Test: pendulum ---\n");
    SessionRandom rng(20);
    EngineConfig cfg;
    Pendulum p;
    p.randomize(rng);

    bool bounded = true;
    double t = 0.0;
    for (int i = 0; i < 20000; ++i) {
        t += kFrame;
        p.step(kFrame, t, cfg);
        for (auto* axis : {&p.x, &p.y, &p.rot, &p.zoom})
            if (std::abs(axis->velocity) > Pendulum::kMaxVelocity) bounded = false;
        if (p.offsetX() < 0.45f || p.offsetX() > 0.55f) bounded = false;
        if (p.offsetY() < 0.46f || p.offsetY() > 0.54f) bounded = false;
    }
    CHECK(bounded, "pendulum velocity and offsets stay bounded");

    float angle = p.x.angle;
    p.step(10.0f, t + 10.0, cfg);
    CHECK(std::abs(p.x.angle - angle) <= Pendulum::kMaxVelocity * Pendulum::kMaxStep * 60.0f + 1e-6f,
          "large dt is capped");

    // Full blend: offsets follow the pendulum, rotation moves a fifth of the way
    EngineConfig bc = quietConfig(36u);
    bc.pendulumBlend = 1.0f;
    bc.homeStrength = 0.0f;
    StateEngine e(bc);
    e.connections().clear();
    int ox = indexOf(Dim::GradientOffsetX);
    int oy = indexOf(Dim::GradientOffsetY);
    int rot = indexOf(Dim::DisplacementRotation);
    float rot0 = e.target(rot);
    e.update(kFrame);
    float rotExpected = rot0 + (e.pendulum().rotation() - rot0) * 0.2f;
    rotExpected = std::max(0.0f, std::min(1.0f, rotExpected));
    CHECK_NEAR(e.target(ox), e.pendulum().offsetX(), 2e-4f, "offset x target follows pendulum");
    CHECK_NEAR(e.target(oy), e.pendulum().offsetY(), 2e-4f, "offset y target follows pendulum");
    CHECK_NEAR(e.target(rot), rotExpected, 2e-4f, "rotation blended at a fifth");

    // Locked offsets ignore the pendulum
    StateEngine l(bc);
    l.lockDimension("gradientOffsetX", 0.1f);
    run(l, 30);
    CHECK(l.target(ox) == 0.1f, "locked offset keeps its target");
}

// ============================================================
// Test 17: Projections
// ============================================================
static void testProjections()
{
    fprintf(stdout, "--- Test: projections ---\n");
    StateEngine e(22u);

    auto a = e.getAudioState();
    CHECK_NEAR(a.filterCutoff, 100.0f + 0.16f * 3900.0f, 0.01f, "filter cutoff scaled to Hz");
    CHECK_NEAR(a.droneBasePitch, 60.0f, 0.01f, "drone base pitch mid-range");
    CHECK_NEAR(a.audioBass, 0.625f, 1e-6f, "bass level raw");

    auto v = e.getVisualState();
    CHECK_NEAR(v.displacementStrength, 1.3f, 1e-5f, "strength with no focus");
    CHECK_NEAR(v.vignette, 0.0f, 1e-7f, "vignette raw");
    CHECK(v.rippleOrigin2X >= 0.0f && v.rippleOrigin2X <= 1.0f, "orbit clamped");

    StateEngine o(quietConfig(37u));
    run(o, 600);
    auto orbit = [&](int index, float radius, bool yAxis) {
        float speed = 0.03f / (float)index;
        float phase = (float)index * 3.14159265358979f * 0.667f;
        float angle = (float)o.time() * speed + phase;
        float centre = yAxis ? o.get("displacementY") : o.get("displacementX");
        float offset = (yAxis ? std::sin(angle) : std::cos(angle)) * radius * 0.5f;
        return std::max(0.0f, std::min(1.0f, centre + offset));
    };
    auto ov = o.getVisualState();
    CHECK_NEAR(ov.rippleOrigin2X, orbit(2, 0.25f, false), 1e-5f, "origin 2 x orbits displacement centre");
    CHECK_NEAR(ov.rippleOrigin2Y, orbit(2, 0.25f, true), 1e-5f, "origin 2 y orbits displacement centre");
    CHECK_NEAR(ov.rippleOrigin3X, orbit(3, 0.35f, false), 1e-5f, "origin 3 x orbits displacement centre");
    CHECK_NEAR(ov.rippleOrigin3Y, orbit(3, 0.35f, true), 1e-5f, "origin 3 y orbits displacement centre");

    e.setDimensionValue("displacementRings", 0.55f);
    CHECK_EQ(e.getVisualState().displacementRings, 9, "rings floor(4 + 0.55*10)");

    e.setFocusMode(true, 1.0f);
    run(e, 200);
    auto focused = e.getVisualState();
    float strengthRaw = 1.0f + e.get("displacementStrength") * 2.0f;
    CHECK_NEAR(focused.displacementStrength, strengthRaw * (1.0f + e.focusIntensity() * 0.7f), 1e-4f,
               "focus boosts displacement strength");

    // Pure reads: two calls without update agree
    auto s1 = juce::JSON::toString(e.getVisualState().toVar());
    auto s2 = juce::JSON::toString(e.getVisualState().toVar());
    CHECK(s1 == s2, "visual projection is idempotent");
    auto a1 = juce::JSON::toString(e.getAudioState().toVar());
    auto a2 = juce::JSON::toString(e.getAudioState().toVar());
    CHECK(a1 == a2, "audio projection is idempotent");

    auto vv = e.getVisualState();
    auto vs = vv.toVar();
    CHECK((int)vs["displacementRings"] == vv.displacementRings, "rings serialized as int");
    CHECK_NEAR((float)(double)vs["focusIntensity"], vv.focusIntensity, 1e-6f, "focus intensity serialized");
    CHECK_NEAR((float)(double)vs["rippleOrigin3Y"], vv.rippleOrigin3Y, 1e-6f, "orbit origin serialized");

    auto all = e.getAllState();
    CHECK(all.hasProperty("foldAmount"), "getAllState includes aliases");
    CHECK_EQ(all.getDynamicObject()->getProperties().size(), 73, "getAllState has every name");

    auto values = e.getArray({"blur", "nope", "glow"});
    CHECK_EQ((int)values.size(), 3, "getArray keeps order and length");
    CHECK(values[1] == 0.0f, "unknown name in array reads 0");
    CHECK_NEAR(e.getScaled("blur", 10.0f, 20.0f), 10.0f + e.get("blur") * 10.0f, 1e-5f, "getScaled");
}

// ============================================================
// Test 18: Determinism
// ============================================================
static void testDeterminism()
{
    fprintf(stdout, "--- Test: determinism ---\n");
    StateEngine a(77u), b(77u);

    for (int f = 0; f < 900; ++f) {
        if (f % 90 == 0) {
            a.handleKeyPress('k');
            b.handleKeyPress('k');
        }
        a.handleMouseMove(0.3f, 0.7f);
        b.handleMouseMove(0.3f, 0.7f);
        a.update(kFrame);
        b.update(kFrame);
    }

    bool same = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (a.current(i) != b.current(i)) same = false;
    CHECK(same, "same seed and inputs give identical state");
    CHECK(juce::JSON::toString(a.getAllState()) == juce::JSON::toString(b.getAllState()), "identical getAllState");
}

// ============================================================
// Test 19: EngineConfig JSON
// ============================================================
static void testEngineConfig()
{
    fprintf(stdout, "--- Test: engine config ---\n");
    EngineConfig c;
    c.seed = 5;
    c.momentum = 0.9f;
    c.maxActiveShifts = 3;
    auto back = EngineConfig::fromVar(c.toVar());
    CHECK_EQ((int)back.seed, 5, "seed survives");
    CHECK_NEAR(back.momentum, 0.9f, 1e-6f, "momentum survives");
    CHECK_EQ(back.maxActiveShifts, 3, "max shifts survives");

    auto partial = EngineConfig::fromVar(juce::JSON::parse(
        "{\"smoothing\": {\"velocity_cap\": 0.002, \"momentum\": \"fast\"},"
        " \"manual\": {\"hold_min\": 40, \"hold_max\": 20},"
        " \"random_connections\": 4}"));
    CHECK_NEAR(partial.velocityCap, 0.002f, 1e-7f, "present field read");
    CHECK_NEAR(partial.momentum, 0.998f, 1e-7f, "non-numeric field keeps default");
    CHECK_NEAR(partial.acceleration, 0.08f, 1e-7f, "missing field keeps default");
    CHECK(partial.holdMinSeconds == 20.0f && partial.holdMaxSeconds == 40.0f, "reversed range swapped");
    CHECK_EQ(partial.randomConnectionCount, 4, "connection count read");

    StateEngine e(partial);
    CHECK_EQ(e.connections().size(), ConnectionGraph::curatedCount() + 4, "engine honours connection count");

    auto garbage = EngineConfig::fromVar(juce::JSON::parse("[1, 2, 3]"));
    CHECK_NEAR(garbage.momentum, 0.998f, 1e-7f, "non-object gives defaults");

    auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                    .getChildFile("reflection_test_config.json");
    c.pendulumBlend = 0.01f;
    CHECK(c.saveToFile(file), "config saved");
    auto loaded = EngineConfig::loadFromFile(file);
    CHECK_NEAR(loaded.pendulumBlend, 0.01f, 1e-7f, "config loaded from file");

    file.replaceWithText("{ not json");
    auto bad = EngineConfig::loadFromFile(file);
    CHECK_NEAR(bad.pendulumBlend, 0.005f, 1e-7f, "malformed file gives defaults");
    file.deleteFile();

    auto missing = EngineConfig::loadFromFile(file);
    CHECK_EQ((int)missing.seed, 0, "missing file gives defaults");
}

// ============================================================
// Test 20: Presets
// ============================================================
static void testPresets()
{
    fprintf(stdout, "--- Test: presets ---\n");
    auto& builtIns = Preset::getBuiltIns();
    CHECK_EQ((int)builtIns.size(), 7, "7 built-in presets");

    const char* names[] = {"calm", "softBlobs", "singleRing", "multiRings", "chromatic", "angular", "minimal"};
    for (auto* n : names)
        CHECK(Preset::find(n) != nullptr, (std::string("built-in ") + n).c_str());
    CHECK(Preset::find("loud") == nullptr, "unknown preset not found");

    StateEngine e(23u);
    CHECK(Preset::apply(e, "calm"), "calm applies");
    CHECK(e.get("blur") == 0.4f, "calm blur");
    CHECK(e.get("vignette") == 0.3f, "calm vignette");
    CHECK(e.get("displacementStrength") == 0.4f, "calm strength");
    CHECK(!Preset::apply(e, "loud"), "unknown built-in rejected");

    CHECK(Preset::apply(e, "angular"), "angular applies");
    CHECK(e.get("morphType") == 0.5f, "angular sets morph type");

    StatePreset custom;
    custom.name = "custom";
    custom.values = {{"glow", 0.7f}, {"notReal", 0.1f}, {"particleSize", 0.2f}};
    CHECK_EQ(Preset::apply(e, custom), 2, "unknown names skipped");
    CHECK(e.get("glow") == 0.7f, "custom glow");
    CHECK(e.get("waveAmplitude") == 0.2f, "alias written through preset");

    auto captured = Preset::capture(e, "snap");
    CHECK_EQ((int)captured.values.size(), 64, "capture has every canonical dimension");

    auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                    .getChildFile("reflection_test_presets.json");
    std::vector<StatePreset> list = {builtIns[0], custom};
    CHECK(Preset::saveToFile(file, list), "presets saved");
    auto loaded = Preset::loadFromFile(file);
    CHECK_EQ((int)loaded.size(), 2, "presets loaded");
    if (loaded.size() == 2) {
        CHECK(loaded[0].name == "calm", "first preset name");
        CHECK_EQ((int)loaded[0].values.size(), (int)builtIns[0].values.size(), "value count kept");
        CHECK(loaded[1].name == "custom", "second preset name");
    }
    file.deleteFile();

    CHECK(Preset::fromJSON("garbage").empty(), "garbage JSON gives no presets");
    CHECK(Preset::fromJSON("{\"presets\": [{\"values\": {}}]}").empty(), "nameless preset skipped");
    CHECK(Preset::loadFromFile(file).empty(), "missing file gives no presets");
}

// ============================================================
// Test 21: Snapshots
// ============================================================
static void testSnapshots()
{
    fprintf(stdout, "--- Test: snapshots ---\n");
    StateEngine src(quietConfig(24u));
    src.lockDimension("blur", 0.33f);
    src.spawnParameterShift();
    run(src, 120);

    auto snap = StateSnapshot::capture(src);
    auto* dims = snap.getProperty("dimensions", {}).getArray();
    CHECK(dims != nullptr && dims->size() == 64, "snapshot has 64 dimensions");
    if (dims != nullptr && dims->size() == 64) {
        auto blur = (*dims)[32];
        CHECK(blur.getProperty("name", "").toString() == "blur", "dimension name recorded");
        CHECK(blur.getProperty("mode", "").toString() == "locked", "override mode recorded");
    }
    CHECK(snap.getProperty("shifts", {}).getArray()->size() == 1, "active shift recorded");
    CHECK((juce::int64)snap.getProperty("seed", 0) == 24, "seed recorded");

    StateEngine dst(25u);
    CHECK_EQ(StateSnapshot::restore(dst, snap), 64, "64 values restored");
    bool same = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (std::abs(dst.current(i) - src.current(i)) > 1e-6f) same = false;
    CHECK(same, "restored values match");

    auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                    .getChildFile("reflection_test_snapshot.json");
    CHECK(StateSnapshot::saveToFile(src, file), "snapshot saved");
    auto loaded = StateSnapshot::loadFromFile(file);
    CHECK(loaded.isObject(), "snapshot loaded");
    file.deleteFile();

    CHECK_EQ(StateSnapshot::restore(dst, juce::var("nope")), 0, "bad snapshot restores nothing");
}

// ============================================================
// Test 22: InputQueue
// ============================================================
static void testInputQueue()
{
    fprintf(stdout, "--- Test: input queue ---\n");
    StateEngine direct(26u), queued(26u);
    InputQueue q;

    direct.handleMouseMove(0.9f, 0.1f);
    direct.handleBlink();
    direct.lockDimension("glow", 0.6f);

    q.postMouseMove(0.9f, 0.1f);
    q.postBlink();
    q.postLock("glow", 0.6f);
    CHECK_EQ(q.pending(), 3, "three events pending");
    CHECK_EQ(q.drainInto(queued), 3, "three events applied");
    CHECK_EQ(q.pending(), 0, "queue empty after drain");

    bool same = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (direct.influence(i) != queued.influence(i)) same = false;
    CHECK(same, "queued input matches direct calls");
    CHECK(queued.overrideMode(indexOf(Dim::Glow)) == OverrideState::Mode::Locked, "queued lock applied");

    // Several producer threads
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&q] {
            for (int i = 0; i < 1000; ++i)
                q.postInfluence("noiseAmount", 0.001f);
        });
    }
    for (auto& th : producers)
        th.join();

    StateEngine sink(27u);
    CHECK_EQ(q.drainInto(sink), 4000, "every posted event drained");
    CHECK_NEAR(sink.influence(indexOf(Dim::NoiseAmount)), 4.0f, 1e-3f, "influence summed");
}

// ============================================================
// Test 23: FaceSmoother
// ============================================================
static void testFaceSmoother()
{
    fprintf(stdout, "--- Test: face smoother ---\n");
    FaceSmoother s;
    for (int f = 0; f < 300; ++f)
        s.track(0.9f, 0.5f, 0.3f, kFrame);
    CHECK(s.push().x > 0.7f, "face to the right pushes x positive");
    CHECK(std::abs(s.push().y) < 0.05f, "centred face keeps y near 0");
    CHECK(std::abs(s.push().size) < 0.05f, "rest size keeps size near 0");

    for (int f = 0; f < 300; ++f)
        s.decay(kFrame);
    CHECK(std::abs(s.push().x) < 0.01f, "push relaxes without a face");

    // One broken frame must not poison the springs
    const float nan = std::numeric_limits<float>::quiet_NaN();
    FaceSmoother n;
    n.track(nan, 0.5f, 0.3f, kFrame);
    n.track(0.5f, nan, 0.3f, kFrame);
    n.track(0.5f, 0.5f, 0.3f, nan);
    n.decay(nan);
    for (int f = 0; f < 600; ++f)
        n.track(0.9f, 0.5f, 0.3f, kFrame);
    CHECK(std::isfinite(n.push().x) && std::isfinite(n.push().y) && std::isfinite(n.push().size),
          "push stays finite after a NaN frame");
    CHECK(n.push().x > 0.7f, "tracking recovers after a NaN frame");
    for (int f = 0; f < 600; ++f)
        n.decay(kFrame);
    CHECK(std::isfinite(n.push().x) && std::abs(n.push().x) < 0.01f, "push relaxes after a NaN frame");
}

// ============================================================
// Test 24: Session host
// ============================================================
static void testSession()
{
    fprintf(stdout, "--- Test: session ---\n");
    Session a(quietConfig(28u));

    a.advance(5.0f);
    CHECK_NEAR(a.engine().time(), Session::kMaxFrameDelta, 1e-6, "frame delta capped");
    CHECK(a.frameCount() == 1, "frame counted");

    a.handleKey('g');
    CHECK(a.engine().focusMode().isActive(), "g toggles focus on");
    a.handleKey('G');
    CHECK(!a.engine().focusMode().isActive(), "G toggles focus off");

    a.input().postBlink();
    a.advance(kFrame);
    CHECK(a.engine().influence(indexOf(Dim::Glow)) > 0.2f, "queued input drained on advance");

    for (int f = 0; f < 120; ++f)
        a.faceFrame(true, 0.8f, 0.5f, 0.3f, kFrame);
    CHECK(a.faceSmoother().push().x > 0.0f, "face frames drive the smoother");

    a.faceFrame(true, std::numeric_limits<float>::quiet_NaN(), 0.5f, 0.3f, kFrame);
    a.faceFrame(true, 0.8f, 0.5f, 0.3f, std::numeric_limits<float>::quiet_NaN());
    for (int f = 0; f < 60; ++f)
        a.faceFrame(true, 0.8f, 0.5f, 0.3f, kFrame);
    CHECK(std::isfinite(a.faceSmoother().push().x) && a.faceSmoother().push().x > 0.0f,
          "NaN face frame does not corrupt the smoother");
    a.advance(kFrame);
    CHECK(std::isfinite(a.engine().get("displacementX")), "NaN face frame never reaches the engine");

    for (int f = 0; f < 60; ++f)
        a.advance(kFrame);
    CHECK_NEAR(a.visualState().colorHue1, a.engine().get("colorHue1"), 1e-7f, "projections refreshed");

    Session b(quietConfig(29u));
    CHECK(b.restoreState(a.saveState()), "state blob restores");
    bool same = true;
    for (int i = 0; i < kDimensionCount; ++i)
        if (std::abs(b.engine().current(i) - a.engine().current(i)) > 1e-4f) same = false;
    CHECK(same, "restored session matches");

    juce::MemoryBlock block;
    a.getStateInformation(block);
    Session c(quietConfig(30u));
    CHECK(c.setStateInformation(block.getData(), (int)block.getSize()), "binary state restores");

    CHECK(!c.restoreState("not json"), "garbage state rejected");
    CHECK(!c.restoreState("{\"config\": {}}"), "state without snapshot rejected");
}

// ============================================================
// main
// ============================================================
int main()
{
    // Initialize JUCE (minimal, needed for var, JSON, File operations)
    juce::ScopedJuceInitialiser_GUI init;

    fprintf(stdout, "=== Inner Reflection State Engine Tests ===\n\n");

    testDimensionLayout();
    testInitialization();
    testComplementaryHarmony();
    testConnectionGraph();
    testConnectionPropagation();
    testKeyMappings();
    testLockInvariant();
    testManualHold();
    testOverrideState();
    testBoundaries();
    testStaticDimension();
    testInfluenceDecay();
    testInputHandlers();
    testParameterShifts();
    testFocusMode();
    testPendulum();
    testProjections();
    testDeterminism();
    testEngineConfig();
    testPresets();
    testSnapshots();
    testInputQueue();
    testFaceSmoother();
    testSession();

    fprintf(stdout, "\n=== Results: %d passed, %d failed ===\n", passed, failed);
    return failed > 0 ? 1 : 0;
}
