// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace manzai::timing
{

/// @brief Derives the vowel class from the kana spelling of a mora.
///
/// Accepts hiragana and katakana, including contracted morae such as "キャ" whose vowel is
/// carried by the trailing small kana. The moraic nasal, the geminate and the long-vowel mark
/// have no vowel of their own.
/// @param moraText UTF-8 text of a single mora.
/// @return The vowel class, or std::nullopt if none can be derived.
[[nodiscard]] auto vowelClassOfKana(std::string_view moraText) -> std::optional<VowelClass>;

/// @brief Parses explicit timing segments.
///
/// Each element is an object { "text", "vowel"?, "startMs", "endMs" }. A missing "vowel" is derived
/// from the text via vowelClassOfKana().
/// @param segments A JSON array of segment objects.
/// @return The segments or a ProtocolError.
[[nodiscard]] auto timingFromJson(const nlohmann::json& segments) -> Result<std::vector<TimingSegment>>;

/// @brief Converts a VOICEVOX audio_query document into timing segments.
///
/// Mora durations (consonant_length + vowel_length) and pause morae are accumulated after
/// prePhonemeLength; all lengths are in seconds and scaled by 1 / speedScale.
/// @param query The audio_query JSON object.
/// @return The segments in milliseconds or a ProtocolError.
[[nodiscard]] auto timingFromAudioQuery(const nlohmann::json& query) -> Result<std::vector<TimingSegment>>;

/// @brief Checks that segments are well formed, ordered by start and non-overlapping.
/// @return Success or an InvalidArgument error naming the first offending segment.
[[nodiscard]] auto validateTiming(std::span<const TimingSegment> segments) -> VoidResult;

} // namespace manzai::timing
