// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <render/CharacterModel.hpp>

#include <cstdint>
#include <functional>

namespace manzai
{

/// @brief Identifies the surface-side resources of one loaded character.
using ResourceId = std::uint64_t;

/// @brief Changes of the rendering context reported by a surface.
enum class ContextEvent : std::uint8_t
{
    Lost,     ///< All surface resources are gone.
    Restored, ///< A fresh context is available; resources must be allocated again.
};

/// @brief Horizontal placement of a character on the stage.
enum class StageSide : std::uint8_t
{
    Left,
    Right,
};

/// @brief Everything a surface needs to draw one character for one frame.
struct CharacterPose
{
    Performer performer = Performer::Tsukkomi;
    StageSide side = StageSide::Left;
    float mouthOpen = 0.0f; ///< Normalized 0 (closed) to 1 (fully open).
    float eyeOpen = 1.0f;   ///< Normalized 0 (closed) to 1 (open).
    float breath = 0.0f;    ///< Normalized breathing phase amplitude.
    int offset = 0;         ///< Horizontal idle offset in surface units.
};

/// @brief The device a RenderResourceManager draws on (GPU context, terminal, test fake).
///
/// A surface reports context loss and restoration through its listener on the event loop thread.
class RenderSurface
{
  public:
    using ContextListener = std::function<void(ContextEvent event)>;

    virtual ~RenderSurface() = default;

    /// @brief Returns true while a rendering context exists.
    [[nodiscard]] virtual auto hasContext() const -> bool = 0;

    /// @brief Installs the listener for context changes (empty to remove).
    virtual void setContextListener(ContextListener listener) = 0;

    /// @brief Allocates the resources of a character.
    /// @return The resource id, or DeviceUnavailable/ModelLoadError.
    [[nodiscard]] virtual auto allocate(const CharacterModel& model, Performer performer) -> Result<ResourceId> = 0;

    /// @brief Frees the resources of a character.
    virtual auto free(ResourceId id) -> VoidResult = 0;

    virtual void beginFrame() = 0;
    virtual void drawCharacter(ResourceId id, const CharacterPose& pose) = 0;
    virtual void endFrame() = 0;
};

} // namespace manzai
