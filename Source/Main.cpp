#include "Host/Session.h"
#include "Model/Preset.h"
#include "Model/StateSnapshot.h"
#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <iostream>

using namespace reflection;

namespace {

constexpr float kFrameRate = 60.0f;

EngineConfig configFromArgs(const juce::ArgumentList& args)
{
    EngineConfig config;
    if (args.containsOption("--config")) {
        auto file = args.getExistingFileForOption("--config");
        config = EngineConfig::loadFromFile(file);
    }
    if (args.containsOption("--seed")) {
        auto seed = args.getValueForOption("--seed").getLargeIntValue();
        if (seed <= 0)
            juce::ConsoleApplication::fail("--seed must be a positive integer");
        config.seed = (uint32_t)seed;
    }
    return config;
}

void runSimulation(const juce::ArgumentList& args)
{
    auto config = configFromArgs(args);

    double seconds = 10.0;
    if (args.containsOption("--seconds")) {
        seconds = args.getValueForOption("--seconds").getDoubleValue();
        if (seconds <= 0.0)
            juce::ConsoleApplication::fail("--seconds must be greater than zero");
    }

    Session session(config);

    if (args.containsOption("--preset")) {
        auto name = args.getValueForOption("--preset").toStdString();
        if (!Preset::apply(session.engine(), name))
            juce::ConsoleApplication::fail("unknown preset: " + juce::String(name));
    }

    // Keys are spread evenly over the run, like a slow performer
    auto keys = args.getValueForOption("--keys");
    int frames = juce::jmax(1, (int)(seconds * kFrameRate));
    int keyEvery = keys.isEmpty() ? 0 : juce::jmax(1, frames / (keys.length() + 1));
    int nextKey = 0;

    for (int f = 1; f <= frames; ++f) {
        if (keyEvery > 0 && f % keyEvery == 0 && nextKey < keys.length())
            session.input().postKey((char)keys[nextKey++]);
        session.advance(1.0f / kFrameRate);
    }

    auto& engine = session.engine();
    std::cout << "seed " << engine.seed()
              << ", harmony " << StateEngine::harmonyName(engine.harmony())
              << ", " << session.frameCount() << " frames, t=" << engine.time() << "s\n";

    auto root = new juce::DynamicObject();
    root->setProperty("visual", session.visualState().toVar());
    root->setProperty("audio", session.audioState().toVar());
    std::cout << juce::JSON::toString(juce::var(root)) << std::endl;

    if (args.containsOption("--dump")) {
        auto file = args.getFileForOption("--dump");
        if (!StateSnapshot::saveToFile(engine, file))
            juce::ConsoleApplication::fail("could not write " + file.getFullPathName());
        std::cout << "snapshot written to " << file.getFullPathName() << std::endl;
    }
}

void listPresets(const juce::ArgumentList& args)
{
    auto& presets = Preset::getBuiltIns();
    for (auto& p : presets)
        std::cout << p.name << " (" << p.values.size() << " values)\n";

    if (args.containsOption("--save")) {
        auto file = args.getFileForOption("--save");
        if (!Preset::saveToFile(file, presets))
            juce::ConsoleApplication::fail("could not write " + file.getFullPathName());
    }
}

void writeConfig(const juce::ArgumentList& args)
{
    auto file = args.getFileForOption("--write-config");
    if (!EngineConfig().saveToFile(file))
        juce::ConsoleApplication::fail("could not write " + file.getFullPathName());
    std::cout << "default config written to " << file.getFullPathName() << std::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    juce::ConsoleApplication app;
    app.addHelpCommand("--help|-h", "Inner Reflection state engine", true);
    app.addVersionCommand("--version|-v", "InnerReflection 1.0.0");

    app.addCommand({"--run",
                    "--run [--seconds=N] [--seed=N] [--preset=name] [--config=file] [--keys=abc] [--dump=file]",
                    "Simulate the engine at 60 fps and print the final projections",
                    "Runs a headless session, optionally seeded, preset and played with keys, "
                    "then prints the visual and audio state as JSON.",
                    runSimulation});

    app.addCommand({"--presets",
                    "--presets [--save=file]",
                    "List built-in presets",
                    "Lists the built-in looks, optionally writing them as a JSON preset file.",
                    listPresets});

    app.addCommand({"--write-config",
                    "--write-config=file",
                    "Write the default engine config",
                    "Writes every tuning constant with its default value as JSON.",
                    writeConfig});

    return app.findAndRunCommand(argc, argv);
}
