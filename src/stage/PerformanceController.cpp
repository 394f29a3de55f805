// SPDX-License-Identifier: Apache-2.0
#include "PerformanceController.hpp"

#include <core/Log.hpp>
#include <stage/Dialogue.hpp>

#include <algorithm>

namespace manzai
{

PerformanceController::PerformanceController(EventLoop& loop,
                                             AudioBackend& audio,
                                             RenderResourceManager& renderer,
                                             SequencerConfig config):
    _loop(loop), _renderer(renderer), _sequencer(loop, audio, renderer, config)
{
    _sequencer.setObserver([this](const ProgressEvent& event) { onProgress(event); });
}

PerformanceController::~PerformanceController()
{
    stopRendering();
    _sequencer.setObserver({});
    _sequencer.stop();
    _bridge.detach();
}

void PerformanceController::loadCharacter(Performer role, std::string modelRef)
{
    ++_pendingLoads;
    _bridge.setModelRef(role, modelRef);
    _renderer.loadModel(role,
                        std::move(modelRef),
                        [this, alive = std::weak_ptr<bool>(_alive), role](Result<RendererInfo> result) {
                            if (!alive.expired())
                                onCharacterLoaded(role, result);
                        });
}

void PerformanceController::onCharacterLoaded(Performer role, const Result<RendererInfo>& result)
{
    --_pendingLoads;
    if (!result)
        log::warning("{} performs audio-only: {}", performerToString(role), result.error());
    else if (_missingCharacters)
    {
        _failed = false;
        _missingCharacters = false;
    }

    startWhenReady();
}

auto PerformanceController::load(std::vector<AudioClip> dialogue) -> VoidResult
{
    if (_sequencer.isActive())
        return makeError(ErrorCode::InvalidState, "Cannot load a dialogue while performing");

    if (auto result = validateDialogue(dialogue); !result)
    {
        fail(result.error().message);
        return result;
    }

    if (auto result = _sequencer.load(std::move(dialogue)); !result)
        return result;

    _failed = false;
    _missingCharacters = false;
    _playRequested = false;
    return {};
}

void PerformanceController::play()
{
    if (_failed && !_missingCharacters)
    {
        log::debug("play() ignored: performance failed");
        return;
    }
    if (_sequencer.isActive())
    {
        log::debug("play() ignored: already performing");
        return;
    }

    _failed = false;
    _missingCharacters = false;
    _playRequested = true;
    startWhenReady();
}

void PerformanceController::stop()
{
    _playRequested = false;
    _sequencer.stop();
}

void PerformanceController::setObserver(ProgressObserver observer)
{
    _observer = std::move(observer);
}

void PerformanceController::attachMirror(std::shared_ptr<DisplaySurface> surface)
{
    _bridge.attach(std::move(surface));
}

void PerformanceController::detachMirror()
{
    _bridge.detach();
}

void PerformanceController::startRendering()
{
    if (_renderFrame != 0)
        return;
    _renderFrame = _loop.requestFrame([this](double deltaMs) { renderFrame(deltaMs); });
}

void PerformanceController::stopRendering()
{
    _loop.cancelFrame(_renderFrame);
    _renderFrame = 0;
}

void PerformanceController::renderFrame(double deltaMs)
{
    _renderFrame = 0;
    _renderer.tick(deltaMs);
    _renderer.draw();
    _renderFrame = _loop.requestFrame([this](double delta) { renderFrame(delta); });
}

auto PerformanceController::state() const noexcept -> SessionState
{
    return _failed ? SessionState::Failed : _sequencer.state();
}

auto PerformanceController::isDone() const noexcept -> bool
{
    auto const current = state();
    return current == SessionState::Finished || current == SessionState::Stopped || current == SessionState::Failed;
}

void PerformanceController::startWhenReady()
{
    if (!_playRequested || _pendingLoads > 0)
        return;
    _playRequested = false;

    auto const anyCharacter = std::ranges::any_of(AllPerformers, [this](Performer role) {
        return _renderer.isLoaded(role);
    });
    if (!anyCharacter)
    {
        fail("no character could be loaded");
        _missingCharacters = true;
        return;
    }

    _sequencer.play();
}

void PerformanceController::fail(std::string_view reason)
{
    log::error("Performance cannot start: {}", reason);
    _failed = true;
    _missingCharacters = false;
    _playRequested = false;
    onProgress(ProgressEvent { .state = SessionState::Failed, .lineIndex = -1, .text = std::string(reason) });
}

void PerformanceController::onProgress(const ProgressEvent& event)
{
    _bridge.relay(event);
    if (auto observer = _observer)
        observer(event);
}

} // namespace manzai
