// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace manzai
{

/// @brief Well-known parameter ids of a character model.
namespace param
{
    inline constexpr auto MouthOpen = std::string_view { "ParamMouthOpenY" };
    inline constexpr auto EyeOpen = std::string_view { "ParamEyeOpen" };
    inline constexpr auto Breath = std::string_view { "ParamBreath" };
} // namespace param

/// @brief Prefix of references to the models compiled into the program.
inline constexpr auto BuiltinModelPrefix = std::string_view { "builtin:" };

/// @brief Value range of a model parameter.
struct ParameterRange
{
    float min = 0.0f;
    float max = 1.0f;
    float defaultValue = 0.0f;
};

/// @brief Idle animation timing of a character.
struct IdleMotion
{
    double breathPeriodMs = 3200.0;
    double blinkIntervalMs = 4000.0;
    double blinkDurationMs = 150.0;
};

/// @brief Text art of a character's face.
struct CharacterFace
{
    std::string eyes = "o   o";
    std::string eyesClosed = "-   -";
    std::array<std::string, 3> mouths { "---", "-o-", "(O)" }; ///< Closed, half open, open.
};

/// @brief A character model: parameters, idle motion and appearance.
struct CharacterModel
{
    std::string name;
    std::string mouthParameter = std::string(param::MouthOpen);
    std::map<std::string, ParameterRange, std::less<>> parameters;
    IdleMotion idle;
    CharacterFace face;
    std::array<std::uint8_t, 3> color { 255, 255, 255 };
};

/// @brief Returns the model a performer uses when nothing else is configured.
[[nodiscard]] auto builtinCharacterModel(Performer performer) -> CharacterModel;

/// @brief Returns the reference of a performer's built-in model ("builtin:tsukkomi" or "builtin:boke").
[[nodiscard]] auto builtinModelRef(Performer performer) -> std::string;

/// @brief Parses a character model document.
/// @return The model or a ModelLoadError.
[[nodiscard]] auto characterModelFromJson(const nlohmann::json& doc) -> Result<CharacterModel>;

/// @brief Loads a model from a reference: a built-in name or a path to a model JSON file.
/// @return The model or a ModelLoadError.
[[nodiscard]] auto loadCharacterModel(std::string_view modelRef) -> Result<CharacterModel>;

} // namespace manzai
