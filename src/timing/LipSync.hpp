// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <span>

namespace manzai::lipsync
{

/// @brief Mouth openness for an open vowel (a).
inline constexpr auto OpenVowelAmplitude = 1.0f;

/// @brief Mouth openness for a mid vowel (e, o).
inline constexpr auto MidVowelAmplitude = 0.7f;

/// @brief Mouth openness for a closed or rounded vowel (i, u).
inline constexpr auto ClosedVowelAmplitude = 0.5f;

/// @brief Mouth openness for a segment without a known vowel (N, cl, consonant-only).
inline constexpr auto ConsonantAmplitude = 0.3f;

/// @brief Returns the fixed amplitude for a vowel class.
[[nodiscard]] constexpr auto amplitude(std::optional<VowelClass> vowel) noexcept -> float
{
    if (!vowel)
        return ConsonantAmplitude;

    switch (*vowel)
    {
        case VowelClass::Open: return OpenVowelAmplitude;
        case VowelClass::Mid: return MidVowelAmplitude;
        case VowelClass::Closed: return ClosedVowelAmplitude;
    }
    return ConsonantAmplitude;
}

/// @brief Finds the segment sounding at tMs.
///
/// Segments are matched half-open, [startMs, endMs), so that exactly one of two adjacent
/// segments matches at their shared boundary.
/// @return The matching segment, or nullptr inside a gap, before the first or after the last segment.
[[nodiscard]] auto findSegment(std::span<const TimingSegment> timing, double tMs) noexcept
    -> const TimingSegment*;

/// @brief Computes the mouth openness in [0, 1] at tMs into a clip.
///
/// Pure function: identical inputs always produce identical output.
/// Returns 0 for empty timing, inter-mora gaps and times outside the timed range.
[[nodiscard]] auto openness(std::span<const TimingSegment> timing, double tMs) noexcept -> float;

} // namespace manzai::lipsync
