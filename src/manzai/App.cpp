// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MiniaudioBackend.hpp>
#include <audio/SimulatedAudioBackend.hpp>
#include <core/EventLoop.hpp>
#include <core/Log.hpp>
#include <render/RenderResourceManager.hpp>
#include <render/TerminalSurface.hpp>
#include <stage/Dialogue.hpp>
#include <stage/PerformanceController.hpp>
#include <stage/ProcessDisplaySurface.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <format>

#include <unistd.h>

namespace manzai
{

namespace
{
    std::atomic<bool> gInterrupted { false }; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};          // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigintHandler(int /*sig*/)
    {
        gInterrupted.store(true);
    }

    constexpr auto WatchIntervalMs = 50.0;

    auto captionFor(const ProgressEvent& event) -> std::string
    {
        switch (event.state)
        {
            case SessionState::LinePlaying:
            case SessionState::LineTransition:
                if (event.role)
                    return std::format("{}: {}", performerToString(*event.role), event.text);
                return event.text;
            case SessionState::Finished: return "(finished)";
            case SessionState::Stopped: return "(stopped)";
            case SessionState::Failed: return std::format("(failed) {}", event.text);
            case SessionState::Idle: break;
        }
        return {};
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::filesystem::path dialoguePath;

    EventLoop loop;
    TerminalSurface surface;
    std::unique_ptr<AudioBackend> audio;
    std::unique_ptr<RenderResourceManager> renderer;
    std::unique_ptr<PerformanceController> controller;
    std::shared_ptr<ProcessDisplaySurface> display;
    Dialogue dialogue;

    bool interrupted = false;
    bool signalsInstalled = false;

    Impl(AppConfig cfg, std::filesystem::path path):
        config(std::move(cfg)),
        dialoguePath(std::move(path)),
        surface(loop,
                STDOUT_FILENO,
                TerminalSurfaceConfig {
                    .chromaKey = tui::RgbColor { config.render.chromaKey[0],
                                                 config.render.chromaKey[1],
                                                 config.render.chromaKey[2] },
                })
    {
    }

    auto createAudio() -> std::unique_ptr<AudioBackend>
    {
        if (config.audio.enabled)
        {
            auto backend = std::make_unique<MiniaudioBackend>(loop);
            auto result = backend->initialize(MiniaudioBackendConfig {
                .deviceName = config.audio.deviceName,
                .volume = config.audio.volume,
            });
            if (result)
                return backend;
            log::warning("Audio output unavailable, performing silently: {}", result.error());
        }
        return std::make_unique<SimulatedAudioBackend>(loop);
    }

    void startMirror()
    {
        display = std::make_shared<ProcessDisplaySurface>();
        auto result = display->start(ProcessDisplayConfig {
            .command = config.mirror.command,
            .args = config.mirror.args,
        });
        if (!result)
        {
            log::warning("Mirror display not started: {}", result.error());
            display.reset();
            return;
        }
        controller->attachMirror(display);
    }

    void onProgress(const ProgressEvent& event)
    {
        if (auto caption = captionFor(event); !caption.empty())
            surface.setCaption(std::move(caption));
    }

    void watch()
    {
        static_cast<void>(loop.setTimeout(WatchIntervalMs, [this] {
            if (gInterrupted.exchange(false) && !interrupted)
            {
                log::info("Interrupted");
                interrupted = true;
                controller->stop();
            }

            if (controller->isDone() || interrupted)
            {
                loop.quit();
                return;
            }
            watch();
        }));
    }

    void installSignals()
    {
        struct sigaction sa {};
        sa.sa_handler = sigintHandler;
        sa.sa_flags = SA_RESTART;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, &gPrevSigint);
        signalsInstalled = true;
    }

    void restoreSignals()
    {
        if (!signalsInstalled)
            return;
        sigaction(SIGINT, &gPrevSigint, nullptr);
        signalsInstalled = false;
    }
};

App::App(AppConfig config, std::filesystem::path dialoguePath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(dialoguePath)))
{
}

App::~App()
{
    log::setCallback({});
    if (_impl->controller)
        _impl->controller->detachMirror();
    if (_impl->display)
        _impl->display->close();
    _impl->controller.reset();
    _impl->renderer.reset();
    _impl->surface.shutdown();
    _impl->restoreSignals();
}

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    auto dialogue = loadDialogue(impl.dialoguePath);
    if (!dialogue)
        return std::unexpected(dialogue.error());
    impl.dialogue = std::move(*dialogue);
    log::info("Loaded \"{}\" ({} lines)", impl.dialogue.title, impl.dialogue.clips.size());

    impl.audio = impl.createAudio();

    if (auto result = impl.surface.initialize(); !result)
        log::warning("Terminal stage unavailable: {}", result.error());

    impl.renderer = std::make_unique<RenderResourceManager>(
        impl.loop, impl.surface, RendererSettings { .smoothingMs = impl.config.render.smoothingMs });
    impl.controller = std::make_unique<PerformanceController>(
        impl.loop,
        *impl.audio,
        *impl.renderer,
        SequencerConfig { .transitionPauseMs = impl.config.playback.transitionPauseMs });
    impl.controller->setObserver([&impl](const ProgressEvent& event) { impl.onProgress(event); });

    if (impl.surface.hasContext())
    {
        // Log lines would tear the stage; show warnings in the caption row instead.
        log::setCallback([&impl](log::Level level, std::string_view message) {
            if (level <= log::Level::Warning)
                impl.surface.setCaption(std::format("[{}] {}", log::levelToString(level), message));
        });
    }

    impl.installSignals();
    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;

    impl.controller->loadCharacter(Performer::Tsukkomi, impl.config.characters.tsukkomi);
    impl.controller->loadCharacter(Performer::Boke, impl.config.characters.boke);

    if (impl.config.mirror.enabled)
        impl.startMirror();

    if (!impl.dialogue.title.empty())
        impl.surface.setCaption(impl.dialogue.title);

    if (auto result = impl.controller->load(impl.dialogue.clips); !result)
        return ExitFailed;

    impl.controller->startRendering();
    impl.controller->play();
    impl.watch();

    auto const frameInterval = std::chrono::milliseconds(1000 / std::max(1, impl.config.playback.frameRate));
    impl.loop.run(frameInterval);

    impl.controller->stopRendering();
    impl.restoreSignals();

    if (impl.interrupted)
        return ExitInterrupted;
    switch (impl.controller->state())
    {
        case SessionState::Finished: return ExitFinished;
        case SessionState::Stopped: return ExitInterrupted;
        default: return ExitFailed;
    }
}

} // namespace manzai
