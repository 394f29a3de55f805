// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manzai
{

/// @brief One of the two fixed conversational roles of a manzai duo.
enum class Performer : std::uint8_t
{
    Tsukkomi, ///< The straight man (performer A).
    Boke,     ///< The funny man (performer B).
};

/// @brief Both performers, in slot order.
inline constexpr auto AllPerformers = std::array { Performer::Tsukkomi, Performer::Boke };

/// @brief Number of performer slots.
inline constexpr auto PerformerCount = AllPerformers.size();

/// @brief Returns the slot index of a performer (0 for tsukkomi, 1 for boke).
[[nodiscard]] constexpr auto performerIndex(Performer performer) noexcept -> std::size_t
{
    return performer == Performer::Tsukkomi ? 0 : 1;
}

/// @brief Converts a Performer to its wire/display name.
[[nodiscard]] constexpr auto performerToString(Performer performer) -> std::string_view
{
    switch (performer)
    {
        case Performer::Tsukkomi: return "tsukkomi";
        case Performer::Boke: return "boke";
    }
    return "tsukkomi";
}

/// @brief Parses a performer name. Accepts "tsukkomi"/"boke" and the aliases "A"/"B".
[[nodiscard]] constexpr auto performerFromString(std::string_view str) -> std::optional<Performer>
{
    if (str == "tsukkomi" || str == "A" || str == "a")
        return Performer::Tsukkomi;
    if (str == "boke" || str == "B" || str == "b")
        return Performer::Boke;
    return std::nullopt;
}

/// @brief Articulatory class of the vowel voiced in a timing segment.
enum class VowelClass : std::uint8_t
{
    Open,   ///< a
    Mid,    ///< e, o
    Closed, ///< i, u (closed/rounded)
};

/// @brief Parses a vowel symbol as used by VOICEVOX ("a", "i", "u", "e", "o", upper case when devoiced).
/// @return The vowel class, or std::nullopt for consonant-only symbols ("N", "cl", "pau").
[[nodiscard]] constexpr auto vowelClassFromSymbol(std::string_view symbol) -> std::optional<VowelClass>
{
    if (symbol == "a" || symbol == "A")
        return VowelClass::Open;
    if (symbol == "e" || symbol == "E" || symbol == "o" || symbol == "O")
        return VowelClass::Mid;
    if (symbol == "i" || symbol == "I" || symbol == "u" || symbol == "U")
        return VowelClass::Closed;
    return std::nullopt;
}

/// @brief Returns the canonical symbol of a vowel class ("a", "e", "i").
[[nodiscard]] constexpr auto vowelClassToSymbol(VowelClass vowel) -> std::string_view
{
    switch (vowel)
    {
        case VowelClass::Open: return "a";
        case VowelClass::Mid: return "e";
        case VowelClass::Closed: return "i";
    }
    return "a";
}

/// @brief A single line of generated dialogue.
struct DialogueLine
{
    Performer role = Performer::Tsukkomi;
    std::string text;
};

/// @brief Timing of one mora (or phoneme) inside an audio clip, in milliseconds.
///
/// Segments of a clip satisfy startMs < endMs, are ordered by startMs and never overlap.
struct TimingSegment
{
    std::string text;
    std::optional<VowelClass> vowelClass;
    double startMs = 0.0;
    double endMs = 0.0;
};

/// @brief A voiced dialogue line: the line, its synthesized audio and the mora timing.
struct AudioClip
{
    DialogueLine line;
    std::string audioRef; ///< Path of the synthesized audio file.
    std::vector<TimingSegment> timing;

    /// @brief Returns the end of the last timing segment, or 0 for an untimed clip.
    [[nodiscard]] auto timedDurationMs() const noexcept -> double
    {
        return timing.empty() ? 0.0 : timing.back().endMs;
    }
};

} // namespace manzai
