// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <memory>

namespace manzai
{

/// @brief Callbacks reporting the progress of one audio handle.
///
/// All callbacks are invoked on the event loop thread, never from inside start().
struct AudioEvents
{
    std::function<void()> onStarted;
    std::function<void()> onEnded;
    std::function<void(Error error)> onError;
};

/// @brief Playback of a single audio clip.
///
/// A handle is started at most once. After stop() or destruction no further events are delivered.
class AudioHandle
{
  public:
    virtual ~AudioHandle() = default;

    /// @brief Requests playback to start.
    ///
    /// Starting is asynchronous: exactly one of onStarted or onError follows, and after onStarted
    /// exactly one of onEnded or onError.
    virtual void start(AudioEvents events) = 0;

    /// @brief Returns the playback position in milliseconds (0 before start).
    [[nodiscard]] virtual auto elapsedMs() const -> double = 0;

    /// @brief Halts playback and rewinds. Safe to call repeatedly.
    virtual void stop() = 0;
};

/// @brief Opens audio handles for clips.
class AudioBackend
{
  public:
    virtual ~AudioBackend() = default;

    /// @brief Opens the audio of a clip for playback.
    /// @return A handle, or an AudioLoadError when the audio cannot be read or decoded.
    [[nodiscard]] virtual auto open(const AudioClip& clip) -> Result<std::unique_ptr<AudioHandle>> = 0;
};

} // namespace manzai
