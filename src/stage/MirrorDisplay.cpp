// SPDX-License-Identifier: Apache-2.0
#include "MirrorDisplay.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace manzai
{

MirrorDisplay::MirrorDisplay(RenderResourceManager& renderer): _renderer(renderer)
{
}

auto MirrorDisplay::handleLine(std::string_view line) -> VoidResult
{
    if (line.empty())
        return {};

    auto message = json::parse(line);
    if (!message)
        return std::unexpected(message.error());
    return handleMessage(*message);
}

auto MirrorDisplay::handleMessage(const nlohmann::json& message) -> VoidResult
{
    auto parsed = mirror::parseMessage(message);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (parsed->hasModelRefs)
        applyModels(parsed->payload);

    auto const models = _state.modelRefs;
    _state = std::move(parsed->payload);
    _state.modelRefs = models;

    applyMouths();
    ++_applied;
    return {};
}

void MirrorDisplay::applyModels(const mirror::MirrorState& snapshot)
{
    for (auto const role: AllPerformers)
    {
        auto const index = performerIndex(role);
        auto const& wanted = snapshot.modelRefs[index];
        if (wanted == _state.modelRefs[index])
            continue;

        _state.modelRefs[index] = wanted;
        if (wanted)
        {
            log::info("Mirror loads model '{}' for {}", *wanted, performerToString(role));
            _renderer.loadModel(role, *wanted);
        }
        else
        {
            _renderer.release(role);
        }
    }
}

void MirrorDisplay::applyMouths()
{
    for (auto const role: AllPerformers)
        _renderer.setParameter(role, MouthOpenAlias, _state.mouths[performerIndex(role)]);
}

} // namespace manzai
