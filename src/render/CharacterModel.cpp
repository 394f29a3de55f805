// SPDX-License-Identifier: Apache-2.0
#include "CharacterModel.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace manzai
{

namespace
{

    void addDefaultParameters(CharacterModel& model)
    {
        model.parameters.try_emplace(model.mouthParameter, ParameterRange {});
        model.parameters.try_emplace(std::string(param::EyeOpen), ParameterRange { .defaultValue = 1.0f });
        model.parameters.try_emplace(std::string(param::Breath), ParameterRange {});
    }

    auto modelError(std::string_view modelRef, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ModelLoadError, std::format("Character model '{}': {}", modelRef, what));
    }

} // namespace

auto builtinCharacterModel(Performer performer) -> CharacterModel
{
    auto model = CharacterModel {};
    switch (performer)
    {
        case Performer::Tsukkomi:
            model.name = "Tsukkomi";
            model.idle = IdleMotion { .breathPeriodMs = 3000.0, .blinkIntervalMs = 3500.0 };
            model.face = CharacterFace {
                .eyes = "o   o",
                .eyesClosed = "-   -",
                .mouths = { "---", "-o-", "(O)" },
            };
            model.color = { 90, 160, 255 };
            break;
        case Performer::Boke:
            model.name = "Boke";
            model.idle = IdleMotion { .breathPeriodMs = 3600.0, .blinkIntervalMs = 4500.0 };
            model.face = CharacterFace {
                .eyes = "@   @",
                .eyesClosed = "^   ^",
                .mouths = { "___", "_o_", "{O}" },
            };
            model.color = { 255, 140, 60 };
            break;
    }
    addDefaultParameters(model);
    return model;
}

auto builtinModelRef(Performer performer) -> std::string
{
    return std::format("{}{}", BuiltinModelPrefix, performerToString(performer));
}

auto characterModelFromJson(const nlohmann::json& doc) -> Result<CharacterModel>
{
    if (!doc.is_object())
        return makeError(ErrorCode::ModelLoadError, "Character model must be a JSON object");

    auto model = CharacterModel {};
    auto name = json::getString(doc, "name");
    if (!name)
        return makeError(ErrorCode::ModelLoadError, name.error().message);
    model.name = *name;
    model.mouthParameter = json::getStringOr(doc, "mouthParameter", param::MouthOpen);

    if (doc.contains("parameters") && doc["parameters"].is_object())
    {
        for (auto const& [id, range]: doc["parameters"].items())
        {
            auto entry = ParameterRange {
                .min = json::getFloatOr(range, "min", 0.0f),
                .max = json::getFloatOr(range, "max", 1.0f),
                .defaultValue = json::getFloatOr(range, "default", 0.0f),
            };
            if (!(entry.min < entry.max))
                return makeError(ErrorCode::ModelLoadError,
                                 std::format("Parameter '{}' has an empty range [{}, {}]", id, entry.min, entry.max));
            entry.defaultValue = std::clamp(entry.defaultValue, entry.min, entry.max);
            model.parameters.insert_or_assign(id, entry);
        }
    }

    if (doc.contains("idle") && doc["idle"].is_object())
    {
        auto const& idle = doc["idle"];
        model.idle.breathPeriodMs = json::getDoubleOr(idle, "breathPeriodMs", model.idle.breathPeriodMs);
        model.idle.blinkIntervalMs = json::getDoubleOr(idle, "blinkIntervalMs", model.idle.blinkIntervalMs);
        model.idle.blinkDurationMs = json::getDoubleOr(idle, "blinkDurationMs", model.idle.blinkDurationMs);
    }

    if (doc.contains("face") && doc["face"].is_object())
    {
        auto const& face = doc["face"];
        model.face.eyes = json::getStringOr(face, "eyes", model.face.eyes);
        model.face.eyesClosed = json::getStringOr(face, "eyesClosed", model.face.eyesClosed);
        if (face.contains("mouths"))
        {
            auto const& mouths = face["mouths"];
            if (!mouths.is_array() || mouths.size() != model.face.mouths.size())
                return makeError(ErrorCode::ModelLoadError, "face.mouths must list exactly three mouth shapes");
            for (auto i = std::size_t { 0 }; i < mouths.size(); ++i)
            {
                if (!mouths[i].is_string())
                    return makeError(ErrorCode::ModelLoadError, "face.mouths entries must be strings");
                model.face.mouths[i] = mouths[i].get<std::string>();
            }
        }
    }

    if (doc.contains("color"))
    {
        auto const& color = doc["color"];
        if (!color.is_array() || color.size() != 3)
            return makeError(ErrorCode::ModelLoadError, "color must be an [r, g, b] array");
        for (auto i = std::size_t { 0 }; i < 3; ++i)
        {
            if (!color[i].is_number_integer())
                return makeError(ErrorCode::ModelLoadError, "color components must be integers");
            model.color[i] = static_cast<std::uint8_t>(std::clamp(color[i].get<int>(), 0, 255));
        }
    }

    addDefaultParameters(model);
    return model;
}

auto loadCharacterModel(std::string_view modelRef) -> Result<CharacterModel>
{
    if (modelRef.starts_with(BuiltinModelPrefix))
    {
        auto const name = modelRef.substr(BuiltinModelPrefix.size());
        if (auto const performer = performerFromString(name))
            return builtinCharacterModel(*performer);
        return modelError(modelRef, "unknown built-in model");
    }

    if (modelRef.empty())
        return makeError(ErrorCode::ModelLoadError, "Empty character model reference");

    auto file = std::ifstream(std::string(modelRef));
    if (!file)
        return modelError(modelRef, "cannot open file");

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto doc = json::parse(ss.str());
    if (!doc)
        return modelError(modelRef, doc.error().message);

    auto model = characterModelFromJson(*doc);
    if (!model)
        return modelError(modelRef, model.error().message);
    return model;
}

} // namespace manzai
