// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace manzai
{

/// @brief A voiced dialogue, as handed over by the synthesis step.
struct Dialogue
{
    std::string title;
    std::vector<AudioClip> clips;
};

/// @brief Parses a dialogue manifest.
///
/// Format:
/// @code
/// { "title": "...",
///   "lines": [ { "role": "tsukkomi", "text": "...", "audio": "line0.wav",
///                "timing": [ { "text": "な", "vowel": "a", "startMs": 0, "endMs": 120 } ] },
///              { "role": "boke", "text": "...", "audio": "line1.wav", "audioQuery": { ... } } ] }
/// @endcode
/// Relative audio paths are resolved against baseDir.
/// @return The dialogue, or InvalidArgument naming the offending line.
[[nodiscard]] auto dialogueFromJson(const nlohmann::json& doc, const std::filesystem::path& baseDir)
    -> Result<Dialogue>;

/// @brief Reads and parses a dialogue manifest file.
[[nodiscard]] auto loadDialogue(const std::filesystem::path& path) -> Result<Dialogue>;

/// @brief Checks that a dialogue can be performed: at least one line, no empty text and
/// well-formed timing on every line.
[[nodiscard]] auto validateDialogue(std::span<const AudioClip> clips) -> VoidResult;

} // namespace manzai
