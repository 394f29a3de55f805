// SPDX-License-Identifier: Apache-2.0
#include "PlaybackSequencer.hpp"

#include <core/Log.hpp>
#include <timing/LipSync.hpp>

#include <algorithm>

namespace manzai
{

auto sessionStateToString(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Idle: return "idle";
        case SessionState::LinePlaying: return "playing";
        case SessionState::LineTransition: return "transition";
        case SessionState::Finished: return "finished";
        case SessionState::Stopped: return "stopped";
        case SessionState::Failed: return "failed";
    }
    return "idle";
}

auto sessionStateFromString(std::string_view name) -> std::optional<SessionState>
{
    for (auto const state: { SessionState::Idle,
                             SessionState::LinePlaying,
                             SessionState::LineTransition,
                             SessionState::Finished,
                             SessionState::Stopped,
                             SessionState::Failed })
    {
        if (sessionStateToString(state) == name)
            return state;
    }
    return std::nullopt;
}

PlaybackSequencer::PlaybackSequencer(EventLoop& loop,
                                     AudioBackend& audio,
                                     RenderResourceManager& renderer,
                                     SequencerConfig config):
    _loop(loop), _audio(audio), _renderer(renderer), _config(config)
{
}

PlaybackSequencer::~PlaybackSequencer()
{
    _observer = {};
    cancelPending();
}

auto PlaybackSequencer::load(std::vector<AudioClip> clips) -> VoidResult
{
    if (isActive())
        return makeError(ErrorCode::InvalidState,
                         std::format("Cannot load a dialogue while {}", sessionStateToString(_session.state)));

    ++_epoch;
    _session = PerformanceSession { .clips = std::move(clips), .cursor = -1, .state = SessionState::Idle };
    log::debug("Loaded dialogue with {} lines", _session.clips.size());
    return {};
}

void PlaybackSequencer::play()
{
    if (isActive())
    {
        log::debug("play() ignored: performance already {}", sessionStateToString(_session.state));
        return;
    }

    if (_session.clips.empty())
    {
        log::debug("play() ignored: no dialogue loaded");
        return;
    }

    ++_epoch;
    _session.failures.clear();
    log::info("Starting performance of {} lines", _session.clips.size());
    enterLine(0);
}

void PlaybackSequencer::stop()
{
    if (!isActive())
        return;

    ++_epoch;
    cancelPending();
    closeAllMouths();
    _session.cursor = -1;
    _session.state = SessionState::Stopped;
    log::info("Performance stopped");
    emit();
}

void PlaybackSequencer::setObserver(ProgressObserver observer)
{
    _observer = std::move(observer);
}

void PlaybackSequencer::setTransitionPause(double pauseMs) noexcept
{
    _config.transitionPauseMs = std::max(0.0, pauseMs);
}

auto PlaybackSequencer::isActive() const noexcept -> bool
{
    return _session.state == SessionState::LinePlaying || _session.state == SessionState::LineTransition;
}

void PlaybackSequencer::enterLine(std::size_t index)
{
    _handle.reset();
    _session.cursor = static_cast<int>(index);
    _session.state = SessionState::LinePlaying;
    closeAllMouths();

    auto const& clip = _session.clips[index];
    auto const epoch = _epoch;
    log::debug("Line {}: {} \"{}\"", index, performerToString(clip.line.role), clip.line.text);
    emit();

    // An observer may have stopped the performance.
    if (!isCurrent(epoch, index))
        return;

    auto handle = _audio.open(clip);
    if (!handle)
    {
        endLine(epoch, index, handle.error());
        return;
    }
    _handle = std::move(*handle);

    auto const alive = std::weak_ptr<bool>(_alive);
    _handle->start(AudioEvents {
        .onStarted =
            [this, alive, epoch, index] {
                if (!alive.expired())
                    onAudioStarted(epoch, index);
            },
        .onEnded =
            [this, alive, epoch, index] {
                if (!alive.expired())
                    endLine(epoch, index, std::nullopt);
            },
        .onError =
            [this, alive, epoch, index](Error error) {
                if (!alive.expired())
                    endLine(epoch, index, std::move(error));
            },
    });
}

void PlaybackSequencer::onAudioStarted(std::uint64_t epoch, std::size_t index)
{
    if (!isCurrent(epoch, index) || _session.state != SessionState::LinePlaying || _frame != 0)
        return;

    _frame = _loop.requestFrame([this, epoch, index](double /*deltaMs*/) { onFrame(epoch, index); });
}

void PlaybackSequencer::onFrame(std::uint64_t epoch, std::size_t index)
{
    _frame = 0;
    if (!isCurrent(epoch, index) || _session.state != SessionState::LinePlaying || !_handle)
        return;

    auto const& clip = _session.clips[index];
    auto const value = lipsync::openness(clip.timing, _handle->elapsedMs());
    for (auto const role: AllPerformers)
        setMouth(role, role == clip.line.role ? value : 0.0f);

    emit();

    if (isCurrent(epoch, index) && _session.state == SessionState::LinePlaying)
        _frame = _loop.requestFrame([this, epoch, index](double /*deltaMs*/) { onFrame(epoch, index); });
}

void PlaybackSequencer::endLine(std::uint64_t epoch, std::size_t index, std::optional<Error> error)
{
    if (!isCurrent(epoch, index) || _session.state != SessionState::LinePlaying)
        return;

    if (error)
    {
        log::error("Skipping line {}: {}", index, *error);
        _session.failures.push_back(LineFailure { .lineIndex = index, .error = std::move(*error) });
    }

    _loop.cancelFrame(_frame);
    _frame = 0;
    closeAllMouths();
    _session.state = SessionState::LineTransition;
    emit();

    if (!isCurrent(epoch, index) || _session.state != SessionState::LineTransition)
        return;

    // The finished handle is kept until the pause elapses; it may still be on the call stack.
    _transitionTimer = _loop.setTimeout(_config.transitionPauseMs, [this, epoch, index] {
        _transitionTimer = 0;
        advance(epoch, index);
    });
}

void PlaybackSequencer::advance(std::uint64_t epoch, std::size_t index)
{
    if (!isCurrent(epoch, index) || _session.state != SessionState::LineTransition)
        return;

    if (index + 1 < _session.clips.size())
        enterLine(index + 1);
    else
        finish();
}

void PlaybackSequencer::finish()
{
    cancelPending();
    closeAllMouths();
    _session.cursor = -1;
    _session.state = SessionState::Finished;
    log::info("Performance finished ({} of {} lines skipped)", _session.failures.size(), _session.clips.size());
    emit();
}

auto PlaybackSequencer::isCurrent(std::uint64_t epoch, std::size_t index) const noexcept -> bool
{
    return epoch == _epoch && _session.cursor == static_cast<int>(index);
}

void PlaybackSequencer::setMouth(Performer role, float value)
{
    _mouths[performerIndex(role)] = value;
    _renderer.setParameter(role, MouthOpenAlias, value);
}

void PlaybackSequencer::closeAllMouths()
{
    for (auto const role: AllPerformers)
        setMouth(role, 0.0f);
}

void PlaybackSequencer::cancelPending()
{
    _loop.cancelFrame(_frame);
    _loop.clearTimeout(_transitionTimer);
    _frame = 0;
    _transitionTimer = 0;

    if (_handle)
    {
        _handle->stop();
        _handle.reset();
    }
}

void PlaybackSequencer::emit()
{
    if (!_observer)
        return;

    auto event = ProgressEvent { .state = _session.state, .lineIndex = _session.cursor, .mouths = _mouths };
    if (_session.cursor >= 0)
    {
        auto const& line = _session.clips[static_cast<std::size_t>(_session.cursor)].line;
        event.role = line.role;
        event.text = line.text;
    }

    // Copy so that an observer replacing itself does not destroy the running callback.
    auto observer = _observer;
    observer(event);
}

} // namespace manzai
