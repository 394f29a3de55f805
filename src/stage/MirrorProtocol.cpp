// SPDX-License-Identifier: Apache-2.0
#include "MirrorProtocol.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace manzai::mirror
{

namespace
{

    auto progressPayload(SessionState state,
                         int lineIndex,
                         const std::optional<Performer>& role,
                         const std::string& text,
                         const MouthState& mouths) -> nlohmann::json
    {
        auto payload = nlohmann::json {
            { "state", std::string(sessionStateToString(state)) },
            { "lineIndex", lineIndex },
            { "role", role ? nlohmann::json(std::string(performerToString(*role))) : nlohmann::json(nullptr) },
            { "text", text },
        };

        auto mouthJson = nlohmann::json::object();
        for (auto const performer: AllPerformers)
            mouthJson[std::string(performerToString(performer))] = mouths[performerIndex(performer)];
        payload["mouths"] = std::move(mouthJson);
        return payload;
    }

} // namespace

void apply(MirrorState& state, const ProgressEvent& event)
{
    state.state = event.state;
    state.lineIndex = event.lineIndex;
    state.role = event.role;
    state.text = event.text;
    state.mouths = event.mouths;
}

auto makeSnapshot(const MirrorState& state) -> nlohmann::json
{
    auto payload = progressPayload(state.state, state.lineIndex, state.role, state.text, state.mouths);

    auto models = nlohmann::json::object();
    for (auto const performer: AllPerformers)
    {
        auto const& ref = state.modelRefs[performerIndex(performer)];
        models[std::string(performerToString(performer))] = ref ? nlohmann::json(*ref) : nlohmann::json(nullptr);
    }
    payload["models"] = std::move(models);

    return { { "type", std::string(SnapshotType) }, { "payload", std::move(payload) } };
}

auto makeStateUpdate(const ProgressEvent& event) -> nlohmann::json
{
    return {
        { "type", std::string(StateUpdateType) },
        { "payload", progressPayload(event.state, event.lineIndex, event.role, event.text, event.mouths) },
    };
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    auto type = json::getString(message, "type");
    if (!type)
        return std::unexpected(type.error());
    if (*type != SnapshotType && *type != StateUpdateType)
        return makeError(ErrorCode::ProtocolError, std::format("Unknown mirror message type: {}", *type));

    if (!message.contains("payload") || !message["payload"].is_object())
        return makeError(ErrorCode::ProtocolError, "Mirror message has no payload");
    auto const& payload = message["payload"];

    auto result = Message { .type = *type, .hasModelRefs = *type == SnapshotType };
    auto& state = result.payload;

    auto const stateName = json::getStringOr(payload, "state", "idle");
    auto const parsedState = sessionStateFromString(stateName);
    if (!parsedState)
        return makeError(ErrorCode::ProtocolError, std::format("Unknown session state: {}", stateName));
    state.state = *parsedState;
    state.lineIndex = json::getIntOr(payload, "lineIndex", -1);
    state.role = performerFromString(json::getStringOr(payload, "role", ""));
    state.text = json::getStringOr(payload, "text", "");

    if (payload.contains("mouths") && payload["mouths"].is_object())
    {
        for (auto const performer: AllPerformers)
        {
            auto const value = json::getFloatOr(payload["mouths"], performerToString(performer), 0.0f);
            state.mouths[performerIndex(performer)] = std::clamp(value, 0.0f, 1.0f);
        }
    }

    if (result.hasModelRefs && payload.contains("models") && payload["models"].is_object())
    {
        for (auto const performer: AllPerformers)
        {
            auto const& models = payload["models"];
            auto const key = std::string(performerToString(performer));
            if (models.contains(key) && models[key].is_string())
                state.modelRefs[performerIndex(performer)] = models[key].get<std::string>();
        }
    }

    return result;
}

} // namespace manzai::mirror
