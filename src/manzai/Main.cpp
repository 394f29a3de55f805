// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <manzai/App.hpp>
#include <manzai/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "manzai-stage: performs a voiced two-person comedy dialogue in the terminal" };

    auto dialoguePath = std::string {};
    auto configPath = std::string {};
    auto tsukkomiModel = std::string {};
    auto bokeModel = std::string {};
    auto pauseMs = -1.0;
    auto noAudio = false;
    auto mirror = false;
    auto mirrorOutput = std::string {};
    auto verbose = false;

    app.add_option("dialogue", dialoguePath, "Path to the dialogue manifest (JSON)")->required();
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--tsukkomi-model", tsukkomiModel, "Character model of the tsukkomi (builtin:<name> or path)");
    app.add_option("--boke-model", bokeModel, "Character model of the boke (builtin:<name> or path)");
    app.add_option("--pause-ms", pauseMs, "Pause between lines in milliseconds");
    app.add_flag("--no-audio", noAudio, "Perform silently, timed by the mora timing");
    app.add_flag("--mirror", mirror, "Mirror the stage into a manzai-display process");
    app.add_option("--mirror-output", mirrorOutput, "Terminal device the mirror display draws on");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? manzai::loadConfig() : manzai::loadConfigFromFile(configPath);

    if (!configResult)
    {
        manzai::log::error("Failed to load config: {}", configResult.error().message);
        return manzai::ExitFailed;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    manzai::log::setLevel(verbose ? manzai::log::Level::Debug : config.logLevel);
    if (!tsukkomiModel.empty())
        config.characters.tsukkomi = tsukkomiModel;
    if (!bokeModel.empty())
        config.characters.boke = bokeModel;
    if (pauseMs >= 0.0)
        config.playback.transitionPauseMs = pauseMs;
    if (noAudio)
        config.audio.enabled = false;
    if (mirror || !mirrorOutput.empty())
        config.mirror.enabled = true;
    if (!mirrorOutput.empty())
    {
        config.mirror.args.emplace_back("--output");
        config.mirror.args.push_back(mirrorOutput);
    }

    auto application = manzai::App(std::move(config), dialoguePath);
    auto initResult = application.initialize();
    if (!initResult)
    {
        manzai::log::error("Initialization failed: {}", initResult.error());
        return manzai::ExitFailed;
    }

    return application.run();
}
