// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventLoop.hpp>
#include <core/Types.hpp>
#include <render/CharacterModel.hpp>
#include <render/RenderSurface.hpp>
#include <render/RendererHandle.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace manzai
{

/// @brief Rendering context state of a RenderResourceManager.
enum class RenderState : std::uint8_t
{
    Ready,
    ContextLost,
};

/// @brief Summary of a successfully loaded character.
struct RendererInfo
{
    Performer role = Performer::Tsukkomi;
    std::string modelRef;
    std::string name;
};

/// @brief Owns the renderers of both performers and their surface resources.
///
/// Every method runs on the event loop thread. Loading is asynchronous: the completion
/// callback is always invoked exactly once, on a later loop step. A newer load, a release or a
/// context loss supersedes an in-flight load for the same role.
class RenderResourceManager
{
  public:
    using LoadCallback = std::function<void(Result<RendererInfo> result)>;
    using ModelLoader = std::function<Result<CharacterModel>(std::string_view modelRef)>;

    /// @param loop Loop on which loads complete.
    /// @param surface Surface the characters are drawn on. Must outlive the manager.
    /// @param settings Animation settings for the renderers.
    /// @param loader Resolves model references (defaults to loadCharacterModel).
    RenderResourceManager(EventLoop& loop,
                          RenderSurface& surface,
                          RendererSettings settings = {},
                          ModelLoader loader = {});
    ~RenderResourceManager();

    RenderResourceManager(const RenderResourceManager&) = delete;
    RenderResourceManager& operator=(const RenderResourceManager&) = delete;

    /// @brief Loads a model for a role, replacing any previous one.
    ///
    /// Fails with DeviceUnavailable without a rendering context and with ModelLoadError when the
    /// model cannot be read. The reference is remembered for reloading after a context loss.
    /// The previous renderer is released once the load completes, even when it fails; a
    /// ModelLoadError also forgets the reference, leaving the role without a model.
    void loadModel(Performer role, std::string modelRef, LoadCallback callback = {});

    /// @brief Sets a parameter of a role's renderer. No-op without a renderer or context.
    void setParameter(Performer role, std::string_view name, float value);

    /// @brief Advances idle motion and smoothing of all renderers.
    void tick(double deltaMs);

    /// @brief Draws all loaded renderers.
    void draw();

    /// @brief Releases the renderer of a role. Idempotent.
    void release(Performer role);

    /// @brief Releases all renderers.
    void releaseAll();

    [[nodiscard]] auto state() const noexcept -> RenderState { return _state; }
    [[nodiscard]] auto isLoaded(Performer role) const noexcept -> bool;

    /// @brief Returns the mouth openness last set for a role (0 without a renderer).
    [[nodiscard]] auto openness(Performer role) const -> float;

    /// @brief Returns the model reference remembered for a role.
    [[nodiscard]] auto modelRef(Performer role) const -> std::optional<std::string>;

    /// @brief Returns the renderer of a role, or nullptr.
    [[nodiscard]] auto renderer(Performer role) const noexcept -> const RendererHandle*;

  private:
    void onContextEvent(ContextEvent event);
    void completeLoad(Performer role, std::uint64_t generation, std::string modelRef, LoadCallback callback);
    void freeHandle(Performer role);

    EventLoop& _loop;
    RenderSurface& _surface;
    RendererSettings _settings;
    ModelLoader _loader;
    RenderState _state = RenderState::Ready;

    std::array<std::unique_ptr<RendererHandle>, PerformerCount> _handles;
    std::array<std::optional<std::string>, PerformerCount> _cachedRefs;
    std::array<std::uint64_t, PerformerCount> _generations {};
    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);
};

} // namespace manzai
