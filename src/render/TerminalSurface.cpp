// SPDX-License-Identifier: Apache-2.0
#include "TerminalSurface.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <csignal>
#include <format>
#include <string_view>

namespace manzai
{

namespace
{
    // Set by the SIGWINCH handler, consumed by the active surface on the loop thread.
    std::atomic<bool> gResizePending { false }; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};           // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        gResizePending.store(true);
    }

    constexpr auto SpriteWidth = 11;
    constexpr auto SpriteHeight = 6;
    constexpr auto FaceWidth = 7;

    constexpr auto HalfOpenThreshold = 0.15f;
    constexpr auto OpenThreshold = 0.6f;

    auto mouthIndex(float openness) -> std::size_t
    {
        if (openness < HalfOpenThreshold)
            return 0;
        if (openness < OpenThreshold)
            return 1;
        return 2;
    }
} // namespace

TerminalSurface::TerminalSurface(EventLoop& loop, int fd, TerminalSurfaceConfig config):
    _loop(loop), _output(fd), _config(config)
{
}

TerminalSurface::~TerminalSurface()
{
    shutdown();
}

auto TerminalSurface::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (auto result = _output.initialize(); !result)
        return result;

    if (_config.altScreen)
        _output.enterAltScreen();
    _output.hideCursor();
    if (auto result = _output.flush(); !result)
        return makeError(ErrorCode::DeviceUnavailable, result.error().message);

    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    _initialized = true;
    _context = true;
    watchResize();

    log::debug("Terminal stage is {}x{}", _output.columns(), _output.rows());
    return {};
}

void TerminalSurface::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    _loop.cancelFrame(_watchFrame);
    _loop.clearTimeout(_restoreTimer);
    _watchFrame = 0;
    _restoreTimer = 0;

    _output.writeRaw("\033[m");
    _output.clearScreen();
    _output.showCursor();
    if (_config.altScreen)
        _output.leaveAltScreen();
    if (auto result = _output.flush(); !result)
        log::debug("Restoring the terminal failed: {}", result.error());

    _sprites.clear();
    _context = false;
    _initialized = false;
}

void TerminalSurface::setCaption(std::string caption)
{
    _caption = std::move(caption);
}

void TerminalSurface::setContextListener(ContextListener listener)
{
    _listener = std::move(listener);
}

auto TerminalSurface::allocate(const CharacterModel& model, Performer performer) -> Result<ResourceId>
{
    if (!_context)
        return makeError(ErrorCode::DeviceUnavailable, "Terminal stage is not available");

    auto const id = _nextResource++;
    _sprites.emplace(id,
                     Sprite {
                         .name = model.name.empty() ? std::string(performerToString(performer)) : model.name,
                         .face = model.face,
                         .color = tui::RgbColor { model.color[0], model.color[1], model.color[2] },
                     });
    _lastFrame.clear();
    return id;
}

auto TerminalSurface::free(ResourceId id) -> VoidResult
{
    if (_sprites.erase(id) == 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown sprite {}", id));
    _lastFrame.clear();
    return {};
}

void TerminalSurface::beginFrame()
{
    if (!_context)
        return;

    _output.discard();
    _output.beginSynchronized();
    _output.fillScreen(_config.chromaKey);
}

void TerminalSurface::drawCharacter(ResourceId id, const CharacterPose& pose)
{
    if (!_context)
        return;

    auto const it = _sprites.find(id);
    if (it == _sprites.end())
        return;
    auto const& sprite = it->second;

    auto const cols = _output.columns();
    auto const rows = _output.rows();
    auto const centerCol = pose.side == StageSide::Left ? cols / 4 : (3 * cols) / 4;
    auto const left = std::max(1, centerCol - SpriteWidth / 2 + pose.offset);
    auto const top = std::max(1, rows / 2 - SpriteHeight / 2);

    auto const eyes = pose.eyeOpen >= 0.5f ? sprite.face.eyes : sprite.face.eyesClosed;
    auto const& mouth = sprite.face.mouths[mouthIndex(pose.mouthOpen)];
    auto const arms = pose.breath > 0.5f ? std::string_view { "  \\| |/  " } : std::string_view { "  /| |\\  " };

    auto const lines = std::array {
        std::format(" .{}. ", std::string(FaceWidth, '-')),
        std::format(" |{}| ", tui::centerText(eyes, FaceWidth)),
        std::format(" |{}| ", tui::centerText(mouth, FaceWidth)),
        std::format(" '{}' ", std::string(FaceWidth, '-')),
        tui::centerText(arms, SpriteWidth),
        tui::centerText(sprite.name, SpriteWidth),
    };

    auto const style = tui::Style { .fg = sprite.color, .bg = _config.chromaKey, .bold = true };
    for (auto row = 0; row < SpriteHeight; ++row)
    {
        if (top + row > rows)
            break;
        _output.moveTo(top + row, left);
        _output.write(lines[static_cast<std::size_t>(row)], style);
    }
}

void TerminalSurface::endFrame()
{
    if (!_context)
        return;

    if (!_caption.empty())
    {
        _output.moveTo(_output.rows(), 1);
        _output.write(tui::centerText(_caption, _output.columns()),
                      tui::Style { .fg = tui::RgbColor { 255, 255, 255 }, .bg = tui::RgbColor { 0, 0, 0 } });
    }
    _output.endSynchronized();

    // Identical frames are not written again.
    if (_output.pending() == _lastFrame)
    {
        _output.discard();
        return;
    }
    _lastFrame = std::string(_output.pending());

    if (auto result = _output.flush(); !result)
    {
        log::warning("Terminal stage lost: {}", result.error());
        loseContext();
    }
}

void TerminalSurface::watchResize()
{
    _watchFrame = _loop.requestFrame([this](double /*deltaMs*/) {
        _watchFrame = 0;
        if (gResizePending.exchange(false) && _context)
        {
            log::debug("Terminal resized");
            _output.updateDimensions();
            loseContext();
            _restoreTimer = _loop.setTimeout(0.0, [this] {
                _restoreTimer = 0;
                _context = true;
                notify(ContextEvent::Restored);
            });
        }
        watchResize();
    });
}

void TerminalSurface::loseContext()
{
    _context = false;
    _sprites.clear();
    _lastFrame.clear();
    _output.discard();
    notify(ContextEvent::Lost);
}

void TerminalSurface::notify(ContextEvent event)
{
    if (_listener)
        _listener(event);
}

} // namespace manzai
