// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBackend.hpp>
#include <core/Error.hpp>
#include <core/EventLoop.hpp>
#include <core/Types.hpp>
#include <render/RenderResourceManager.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manzai
{

/// @brief State of a performance, as seen by observers.
///
/// The sequencer itself never enters Failed; that state is reported by the PerformanceController
/// when a performance cannot start at all.
enum class SessionState : std::uint8_t
{
    Idle,
    LinePlaying,
    LineTransition,
    Finished,
    Stopped,
    Failed,
};

/// @brief Returns the wire/display name of a state ("idle", "playing", ...).
[[nodiscard]] auto sessionStateToString(SessionState state) -> std::string_view;

/// @brief Parses a state name produced by sessionStateToString().
[[nodiscard]] auto sessionStateFromString(std::string_view name) -> std::optional<SessionState>;

/// @brief Mouth openness of both performers, indexed by performerIndex().
using MouthState = std::array<float, PerformerCount>;

/// @brief Progress of a performance, reported on every frame while a line plays and on every
/// state transition.
struct ProgressEvent
{
    SessionState state = SessionState::Idle;
    int lineIndex = -1;
    std::optional<Performer> role;
    std::string text;
    MouthState mouths {};
};

/// @brief A line that could not be played.
struct LineFailure
{
    std::size_t lineIndex = 0;
    Error error;
};

/// @brief The dialogue being performed and how far it got.
struct PerformanceSession
{
    std::vector<AudioClip> clips;
    int cursor = -1; ///< Index of the active line, -1 when none is active.
    SessionState state = SessionState::Idle;
    std::vector<LineFailure> failures;
};

/// @brief Timing settings of the sequencer.
struct SequencerConfig
{
    /// @brief Pause between the end of one line and the start of the next.
    double transitionPauseMs = 500.0;
};

/// @brief Walks a dialogue line by line, playing its audio and moving the speaker's mouth.
///
/// States and transitions:
///   Idle/Finished/Stopped --play--> LinePlaying(0)
///   LinePlaying(i) --audio ended or failed--> LineTransition(i)
///   LineTransition(i) --pause elapsed--> LinePlaying(i + 1) or Finished
///   LinePlaying/LineTransition --stop--> Stopped
///
/// All methods and callbacks run on the event loop thread. Every asynchronous completion is
/// tagged with the epoch it was started in; load() and stop() advance the epoch, so completions
/// arriving afterwards are dropped.
class PlaybackSequencer
{
  public:
    using ProgressObserver = std::function<void(const ProgressEvent& event)>;

    PlaybackSequencer(EventLoop& loop,
                      AudioBackend& audio,
                      RenderResourceManager& renderer,
                      SequencerConfig config = {});
    ~PlaybackSequencer();

    PlaybackSequencer(const PlaybackSequencer&) = delete;
    PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

    /// @brief Replaces the dialogue. Only valid while Idle, Finished or Stopped.
    /// @return Success or InvalidState while a performance is running.
    [[nodiscard]] auto load(std::vector<AudioClip> clips) -> VoidResult;

    /// @brief Starts the performance from the first line.
    ///
    /// No-op while a performance is running, and when the dialogue is empty.
    void play();

    /// @brief Halts the performance immediately. No-op unless a line is playing or pausing.
    void stop();

    /// @brief Installs the progress observer (empty to remove).
    void setObserver(ProgressObserver observer);

    /// @brief Sets the pause between lines.
    void setTransitionPause(double pauseMs) noexcept;

    [[nodiscard]] auto state() const noexcept -> SessionState { return _session.state; }
    [[nodiscard]] auto cursor() const noexcept -> int { return _session.cursor; }
    [[nodiscard]] auto session() const noexcept -> const PerformanceSession& { return _session; }
    [[nodiscard]] auto mouths() const noexcept -> const MouthState& { return _mouths; }
    [[nodiscard]] auto epoch() const noexcept -> std::uint64_t { return _epoch; }

    /// @brief Returns true while a line is playing or pausing.
    [[nodiscard]] auto isActive() const noexcept -> bool;

  private:
    void enterLine(std::size_t index);
    void onAudioStarted(std::uint64_t epoch, std::size_t index);
    void onFrame(std::uint64_t epoch, std::size_t index);
    void endLine(std::uint64_t epoch, std::size_t index, std::optional<Error> error);
    void advance(std::uint64_t epoch, std::size_t index);
    void finish();

    [[nodiscard]] auto isCurrent(std::uint64_t epoch, std::size_t index) const noexcept -> bool;
    void setMouth(Performer role, float value);
    void closeAllMouths();
    void cancelPending();
    void emit();

    EventLoop& _loop;
    AudioBackend& _audio;
    RenderResourceManager& _renderer;
    SequencerConfig _config;
    ProgressObserver _observer;

    PerformanceSession _session;
    MouthState _mouths {};
    std::unique_ptr<AudioHandle> _handle;
    std::uint64_t _epoch = 0;
    TaskId _frame = 0;
    TaskId _transitionTimer = 0;
    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);
};

} // namespace manzai
