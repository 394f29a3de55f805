// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <render/CharacterModel.hpp>
#include <render/RenderSurface.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace manzai
{

/// @brief Alias accepted by setParameter() for the model's mouth parameter.
inline constexpr auto MouthOpenAlias = std::string_view { "mouthOpen" };

/// @brief Animation settings shared by all renderers.
struct RendererSettings
{
    /// @brief Time constant of the exponential mouth smoothing (0 disables smoothing).
    double smoothingMs = 60.0;
};

/// @brief A loaded character on the stage.
///
/// Holds the parameter values of the model, animates idle motion and smooths the mouth toward
/// the value last set. Two concrete renderers exist, one per performer.
class RendererHandle
{
  public:
    virtual ~RendererHandle() = default;

    RendererHandle(const RendererHandle&) = delete;
    RendererHandle& operator=(const RendererHandle&) = delete;

    [[nodiscard]] auto performer() const noexcept -> Performer { return _performer; }
    [[nodiscard]] auto modelRef() const noexcept -> const std::string& { return _modelRef; }
    [[nodiscard]] auto model() const noexcept -> const CharacterModel& { return _model; }
    [[nodiscard]] auto resourceId() const noexcept -> ResourceId { return _resourceId; }

    /// @brief Sets a parameter, clamped to its range. "mouthOpen" addresses the mouth parameter.
    /// @return False if the model has no such parameter.
    auto setParameter(std::string_view name, float value) -> bool;

    /// @brief Returns the current value of a parameter.
    [[nodiscard]] auto parameter(std::string_view name) const -> std::optional<float>;

    /// @brief Returns the mouth openness last set, normalized to [0, 1].
    [[nodiscard]] auto currentOpenness() const -> float;

    /// @brief Returns the smoothed mouth openness as drawn, normalized to [0, 1].
    [[nodiscard]] auto displayedOpenness() const noexcept -> float { return _displayedOpenness; }

    /// @brief Advances idle motion and smoothing.
    void tick(double deltaMs);

    /// @brief Returns the pose to draw this frame.
    [[nodiscard]] auto pose() const -> CharacterPose;

    [[nodiscard]] auto isDirty() const noexcept -> bool { return _dirty; }
    void clearDirty() noexcept { _dirty = false; }

    /// @brief Returns where the character stands.
    [[nodiscard]] virtual auto side() const noexcept -> StageSide = 0;

  protected:
    RendererHandle(Performer performer,
                   std::string modelRef,
                   CharacterModel model,
                   ResourceId resourceId,
                   RendererSettings settings);

    /// @brief Returns the horizontal idle offset at the given animation time.
    [[nodiscard]] virtual auto idleOffset(double timeMs) const -> int = 0;

    [[nodiscard]] auto animationTimeMs() const noexcept -> double { return _timeMs; }

  private:
    [[nodiscard]] auto resolveName(std::string_view name) const -> std::string_view;
    [[nodiscard]] auto normalized(std::string_view id) const -> float;

    Performer _performer;
    std::string _modelRef;
    CharacterModel _model;
    ResourceId _resourceId;
    RendererSettings _settings;

    std::map<std::string, float, std::less<>> _values;
    float _displayedOpenness = 0.0f;
    double _timeMs = 0.0;
    bool _dirty = true;
};

/// @brief The straight man: stands left and keeps still.
class TsukkomiRenderer final: public RendererHandle
{
  public:
    TsukkomiRenderer(std::string modelRef, CharacterModel model, ResourceId resourceId, RendererSettings settings);

    [[nodiscard]] auto side() const noexcept -> StageSide override { return StageSide::Left; }

  protected:
    [[nodiscard]] auto idleOffset(double timeMs) const -> int override;
};

/// @brief The funny man: stands right and sways while idle.
class BokeRenderer final: public RendererHandle
{
  public:
    BokeRenderer(std::string modelRef, CharacterModel model, ResourceId resourceId, RendererSettings settings);

    [[nodiscard]] auto side() const noexcept -> StageSide override { return StageSide::Right; }

  protected:
    [[nodiscard]] auto idleOffset(double timeMs) const -> int override;
};

/// @brief Creates the renderer of a performer.
[[nodiscard]] auto makeRenderer(Performer performer,
                                std::string modelRef,
                                CharacterModel model,
                                ResourceId resourceId,
                                RendererSettings settings) -> std::unique_ptr<RendererHandle>;

} // namespace manzai
