// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBackend.hpp>
#include <core/Error.hpp>
#include <core/EventLoop.hpp>
#include <render/RenderResourceManager.hpp>
#include <stage/CrossWindowBridge.hpp>
#include <stage/DisplaySurface.hpp>
#include <stage/PlaybackSequencer.hpp>

#include <memory>
#include <string>
#include <vector>

namespace manzai
{

/// @brief Wires the stage together and exposes the commands of the surrounding application.
///
/// Owns the sequencer and the mirror bridge, drives the render loop and forwards every
/// progress event to the observer and the mirror. A performance that cannot start at all
/// (invalid dialogue, or no character could be loaded) is reported once as SessionState::Failed.
class PerformanceController
{
  public:
    using ProgressObserver = PlaybackSequencer::ProgressObserver;

    PerformanceController(EventLoop& loop,
                          AudioBackend& audio,
                          RenderResourceManager& renderer,
                          SequencerConfig config = {});
    ~PerformanceController();

    PerformanceController(const PerformanceController&) = delete;
    PerformanceController& operator=(const PerformanceController&) = delete;

    /// @brief Loads (or swaps) the character of a role.
    ///
    /// A failed load leaves the role audio-only. play() waits for pending loads. A successful
    /// load clears a Failed state caused by having no character.
    void loadCharacter(Performer role, std::string modelRef);

    /// @brief Validates and loads a dialogue.
    /// @return Success; InvalidArgument (reported to the observer as Failed) for an invalid
    ///         dialogue; InvalidState while a performance is running.
    auto load(std::vector<AudioClip> dialogue) -> VoidResult;

    /// @brief Starts the performance once all pending character loads have completed.
    ///
    /// Ignored after an invalid dialogue until a valid one is loaded. After a start that failed
    /// for lack of characters, play() retries.
    void play();

    /// @brief Stops the performance immediately.
    void stop();

    /// @brief Installs the progress observer (empty to remove).
    void setObserver(ProgressObserver observer);

    /// @brief Starts mirroring into a display.
    void attachMirror(std::shared_ptr<DisplaySurface> surface);

    /// @brief Stops mirroring.
    void detachMirror();

    /// @brief Starts the per-frame tick and draw of the characters. Idempotent.
    void startRendering();

    /// @brief Stops the per-frame tick and draw.
    void stopRendering();

    /// @brief Returns the state of the performance, including Failed.
    [[nodiscard]] auto state() const noexcept -> SessionState;

    /// @brief Returns true once the performance reached Finished, Stopped or Failed.
    [[nodiscard]] auto isDone() const noexcept -> bool;

    [[nodiscard]] auto pendingLoads() const noexcept -> int { return _pendingLoads; }
    [[nodiscard]] auto sequencer() noexcept -> PlaybackSequencer& { return _sequencer; }
    [[nodiscard]] auto bridge() noexcept -> CrossWindowBridge& { return _bridge; }

  private:
    void onProgress(const ProgressEvent& event);
    void onCharacterLoaded(Performer role, const Result<RendererInfo>& result);
    void startWhenReady();
    void fail(std::string_view reason);
    void renderFrame(double deltaMs);

    EventLoop& _loop;
    RenderResourceManager& _renderer;
    PlaybackSequencer _sequencer;
    CrossWindowBridge _bridge;
    ProgressObserver _observer;

    int _pendingLoads = 0;
    bool _playRequested = false;
    bool _failed = false;
    bool _missingCharacters = false; ///< _failed was caused by having no character.
    TaskId _renderFrame = 0;
    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);
};

} // namespace manzai
