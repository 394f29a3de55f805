// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace manzai
{

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/manzai";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/manzai";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/manzai";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top level must be an object", path));

    auto config = AppConfig {};

    // Playback section
    if (root.contains("playback"))
    {
        auto const& playback = root["playback"];
        config.playback.transitionPauseMs =
            std::max(0.0, json::getDoubleOr(playback, "transitionPauseMs", config.playback.transitionPauseMs));
        config.playback.frameRate = std::clamp(json::getIntOr(playback, "frameRate", config.playback.frameRate), 1, 240);
    }

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.enabled = json::getBoolOr(audio, "enabled", true);
        config.audio.deviceName = json::getStringOr(audio, "deviceName", "");
        config.audio.volume = std::clamp(json::getFloatOr(audio, "volume", 1.0f), 0.0f, 1.0f);
    }

    // Characters section
    if (root.contains("characters"))
    {
        auto const& characters = root["characters"];
        config.characters.tsukkomi = json::getStringOr(characters, "tsukkomi", config.characters.tsukkomi);
        config.characters.boke = json::getStringOr(characters, "boke", config.characters.boke);
    }

    // Render section
    if (root.contains("render"))
    {
        auto const& render = root["render"];
        if (render.contains("chromaKey"))
        {
            auto const& key = render["chromaKey"];
            if (!key.is_array() || key.size() != 3
                || !std::ranges::all_of(key, [](auto const& c) { return c.is_number_integer(); }))
                return makeError(ErrorCode::ConfigError, "render.chromaKey must be an [r, g, b] array");
            for (auto i = std::size_t { 0 }; i < 3; ++i)
                config.render.chromaKey[i] = static_cast<std::uint8_t>(std::clamp(key[i].get<int>(), 0, 255));
        }
        config.render.smoothingMs = std::max(0.0, json::getDoubleOr(render, "smoothingMs", config.render.smoothingMs));
    }

    // Mirror section
    if (root.contains("mirror"))
    {
        auto const& mirror = root["mirror"];
        config.mirror.enabled = json::getBoolOr(mirror, "enabled", false);
        config.mirror.command = json::getStringOr(mirror, "command", config.mirror.command);
        if (mirror.contains("args") && mirror["args"].is_array())
        {
            for (const auto& arg: mirror["args"])
            {
                if (arg.is_string())
                    config.mirror.args.push_back(arg.get<std::string>());
            }
        }
    }

    // Log section
    if (root.contains("log"))
    {
        auto const levelName = json::getStringOr(root["log"], "level", "info");
        auto const level = log::levelFromString(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
        config.logLevel = *level;
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["playback"] = {
        { "transitionPauseMs", config.playback.transitionPauseMs },
        { "frameRate", config.playback.frameRate },
    };

    auto audio = nlohmann::json::object();
    audio["enabled"] = config.audio.enabled;
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["volume"] = config.audio.volume;
    root["audio"] = std::move(audio);

    root["characters"] = {
        { "tsukkomi", config.characters.tsukkomi },
        { "boke", config.characters.boke },
    };

    root["render"] = {
        { "chromaKey", config.render.chromaKey },
        { "smoothingMs", config.render.smoothingMs },
    };

    auto mirror = nlohmann::json::object();
    mirror["enabled"] = config.mirror.enabled;
    mirror["command"] = config.mirror.command;
    if (!config.mirror.args.empty())
        mirror["args"] = config.mirror.args;
    root["mirror"] = std::move(mirror);

    root["log"] = { { "level", std::string(log::levelToString(config.logLevel)) } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace manzai
