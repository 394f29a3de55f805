// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBackend.hpp>
#include <core/EventLoop.hpp>

#include <memory>
#include <string>

namespace manzai
{

/// @brief Configuration for the miniaudio playback backend.
struct MiniaudioBackendConfig
{
    /// @brief Case-insensitive substring of the playback device name (empty = default device).
    std::string deviceName;

    /// @brief Master volume applied to every clip (0.0 to 1.0).
    float volume = 1.0f;
};

/// @brief Plays clip audio files through the default (or a named) playback device using miniaudio.
///
/// Every handle decodes its file with ma_decoder and owns its own ma_device. The device callback
/// runs on miniaudio's audio thread and only ever posts events into the EventLoop.
/// Uses PIMPL to isolate miniaudio headers from consumers.
class MiniaudioBackend: public AudioBackend
{
  public:
    explicit MiniaudioBackend(EventLoop& loop);
    ~MiniaudioBackend() override;

    MiniaudioBackend(const MiniaudioBackend&) = delete;
    MiniaudioBackend& operator=(const MiniaudioBackend&) = delete;

    /// @brief Initializes the audio context and resolves the playback device.
    /// @param config Backend configuration.
    /// @return Success or a DeviceUnavailable error.
    [[nodiscard]] auto initialize(const MiniaudioBackendConfig& config) -> VoidResult;

    [[nodiscard]] auto open(const AudioClip& clip) -> Result<std::unique_ptr<AudioHandle>> override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace manzai
