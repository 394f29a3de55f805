// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace manzai
{

/// @brief Playback configuration section.
struct PlaybackConfig
{
    double transitionPauseMs = 500.0;
    int frameRate = 60;
};

/// @brief Audio configuration section.
struct AudioConfig
{
    bool enabled = true;
    std::string deviceName;
    float volume = 1.0f;
};

/// @brief Character model references, one per performer.
struct CharactersConfig
{
    std::string tsukkomi = "builtin:tsukkomi";
    std::string boke = "builtin:boke";
};

/// @brief Render configuration section.
struct RenderConfig
{
    /// @brief Stage background, green by default for chroma keying.
    std::array<std::uint8_t, 3> chromaKey { 0, 255, 0 };
    double smoothingMs = 60.0;
};

/// @brief Mirror display configuration section.
struct MirrorConfig
{
    bool enabled = false;
    std::string command = "manzai-display";
    std::vector<std::string> args;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    PlaybackConfig playback;
    AudioConfig audio;
    CharactersConfig characters;
    RenderConfig render;
    MirrorConfig mirror;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @return The configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/manzai or ~/.config/manzai
/// On macOS: ~/Library/Application Support/manzai
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace manzai
