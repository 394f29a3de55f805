// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <manzai/Config.hpp>

#include <filesystem>
#include <memory>

namespace manzai
{

/// @brief Exit code after the performance finished.
inline constexpr auto ExitFinished = 0;

/// @brief Exit code when the performance could not start.
inline constexpr auto ExitFailed = 1;

/// @brief Exit code after the performance was interrupted with Ctrl+C.
inline constexpr auto ExitInterrupted = 130;

/// @brief The stage application: plays one dialogue on the terminal and exits.
class App
{
  public:
    /// @param config The application configuration.
    /// @param dialoguePath Path of the dialogue manifest to perform.
    App(AppConfig config, std::filesystem::path dialoguePath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Sets up the terminal stage, audio output and the optional mirror display.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Performs the dialogue.
    /// @return ExitFinished, ExitFailed or ExitInterrupted.
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace manzai
