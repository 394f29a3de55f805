// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <render/RenderResourceManager.hpp>
#include <stage/MirrorProtocol.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace manzai
{

/// @brief The receiving end of a CrossWindowBridge.
///
/// Applies mirrored state to its own RenderResourceManager. It only reads: nothing it receives
/// can influence the stage that sent it.
class MirrorDisplay
{
  public:
    explicit MirrorDisplay(RenderResourceManager& renderer);

    /// @brief Applies one newline-delimited JSON message.
    /// @return Success or a ProtocolError for malformed input (the display state is unchanged).
    auto handleLine(std::string_view line) -> VoidResult;

    /// @brief Applies one decoded JSON message.
    auto handleMessage(const nlohmann::json& message) -> VoidResult;

    [[nodiscard]] auto state() const noexcept -> const mirror::MirrorState& { return _state; }
    [[nodiscard]] auto messagesApplied() const noexcept -> std::size_t { return _applied; }

  private:
    void applyModels(const mirror::MirrorState& snapshot);
    void applyMouths();

    RenderResourceManager& _renderer;
    mirror::MirrorState _state;
    std::size_t _applied = 0;
};

} // namespace manzai
