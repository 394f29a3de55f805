// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBackend.hpp>
#include <core/EventLoop.hpp>

namespace manzai
{

/// @brief Silent audio backend clocked by the event loop.
///
/// A clip "plays" for the duration covered by its timing data, so lip-sync and sequencing
/// behave exactly as with real audio. Used for headless runs and when audio output is disabled.
class SimulatedAudioBackend: public AudioBackend
{
  public:
    /// @param loop Loop providing the clock.
    /// @param untimedDurationMs Duration assumed for clips without timing data.
    explicit SimulatedAudioBackend(EventLoop& loop, double untimedDurationMs = 0.0);

    [[nodiscard]] auto open(const AudioClip& clip) -> Result<std::unique_ptr<AudioHandle>> override;

  private:
    EventLoop& _loop;
    double _untimedDurationMs;
};

} // namespace manzai
