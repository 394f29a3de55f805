// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <stage/PlaybackSequencer.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace manzai::mirror
{

/// @brief Type of a full-state message, sent when a display attaches or a model changes.
inline constexpr auto SnapshotType = std::string_view { "SNAPSHOT" };

/// @brief Type of an incremental message, sent on every progress event.
inline constexpr auto StateUpdateType = std::string_view { "STATE_UPDATE" };

/// @brief Everything a display needs to reproduce the stage.
struct MirrorState
{
    SessionState state = SessionState::Idle;
    int lineIndex = -1;
    std::optional<Performer> role;
    std::string text;
    MouthState mouths {};
    std::array<std::optional<std::string>, PerformerCount> modelRefs;
};

/// @brief Folds a progress event into the state.
void apply(MirrorState& state, const ProgressEvent& event);

/// @brief Builds a SNAPSHOT message.
[[nodiscard]] auto makeSnapshot(const MirrorState& state) -> nlohmann::json;

/// @brief Builds a STATE_UPDATE message.
[[nodiscard]] auto makeStateUpdate(const ProgressEvent& event) -> nlohmann::json;

/// @brief A decoded message.
struct Message
{
    std::string type;
    MirrorState payload;
    bool hasModelRefs = false; ///< True for snapshots.
};

/// @brief Decodes a message produced by makeSnapshot() or makeStateUpdate().
/// @return The message, or a ProtocolError.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

} // namespace manzai::mirror
