// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/EventLoop.hpp>
#include <render/RenderSurface.hpp>
#include <tui/TerminalOutput.hpp>

#include <map>
#include <string>

namespace manzai
{

/// @brief Settings of the terminal stage.
struct TerminalSurfaceConfig
{
    tui::RgbColor chromaKey { 0, 255, 0 }; ///< Stage background.
    bool altScreen = true;                ///< Draw on the alternate screen buffer.
};

/// @brief Draws the stage on an ANSI terminal.
///
/// Characters are text sprites on a chroma-key background: the tsukkomi on the left, the boke
/// on the right. A terminal resize invalidates all sprites; it is reported as a context loss,
/// followed by a restoration on the next loop step. Only one surface may watch SIGWINCH at a time.
class TerminalSurface final: public RenderSurface
{
  public:
    TerminalSurface(EventLoop& loop, int fd, TerminalSurfaceConfig config = {});
    ~TerminalSurface() override;

    TerminalSurface(const TerminalSurface&) = delete;
    TerminalSurface& operator=(const TerminalSurface&) = delete;

    /// @brief Prepares the terminal and starts watching for resizes.
    /// @return Success or DeviceUnavailable when fd is not a terminal.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal. Safe to call repeatedly.
    void shutdown();

    /// @brief Sets the caption shown on the bottom row (empty for none).
    void setCaption(std::string caption);

    [[nodiscard]] auto hasContext() const -> bool override { return _context; }
    void setContextListener(ContextListener listener) override;
    [[nodiscard]] auto allocate(const CharacterModel& model, Performer performer) -> Result<ResourceId> override;
    auto free(ResourceId id) -> VoidResult override;
    void beginFrame() override;
    void drawCharacter(ResourceId id, const CharacterPose& pose) override;
    void endFrame() override;

  private:
    struct Sprite
    {
        std::string name;
        CharacterFace face;
        tui::RgbColor color;
    };

    void watchResize();
    void notify(ContextEvent event);
    void loseContext();

    EventLoop& _loop;
    tui::TerminalOutput _output;
    TerminalSurfaceConfig _config;
    ContextListener _listener;
    std::map<ResourceId, Sprite> _sprites;
    ResourceId _nextResource = 1;
    std::string _caption;
    std::string _lastFrame;
    TaskId _watchFrame = 0;
    TaskId _restoreTimer = 0;
    bool _initialized = false;
    bool _context = false;
};

} // namespace manzai
