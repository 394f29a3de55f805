// SPDX-License-Identifier: Apache-2.0
#include "TimingData.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <string>

namespace manzai::timing
{

namespace
{

    // Kana grouped by vowel row, in hiragana. Katakana is folded onto hiragana before lookup.
    constexpr auto RowA = std::u32string_view { U"あかさたなはまやらわがざだばぱぁゃゎ" };
    constexpr auto RowI = std::u32string_view { U"いきしちにひみりぎじぢびぴぃ" };
    constexpr auto RowU = std::u32string_view { U"うくすつぬふむゆるぐずづぶぷぅゅゔ" };
    constexpr auto RowE = std::u32string_view { U"えけせてねへめれげぜでべぺぇゑ" };
    constexpr auto RowO = std::u32string_view { U"おこそとのほもよろをごぞどぼぽぉょ" };

    constexpr auto KatakanaFirst = char32_t { 0x30A1 };
    constexpr auto KatakanaLast = char32_t { 0x30F6 };
    constexpr auto KatakanaToHiragana = char32_t { 0x60 };

    constexpr auto MsPerSecond = 1000.0;

    /// @brief Decodes the last UTF-8 code point of a string, or 0 if it is malformed.
    auto lastCodepoint(std::string_view text) -> char32_t
    {
        if (text.empty())
            return 0;

        auto start = text.size() - 1;
        while (start > 0 && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80)
            --start;

        auto const lead = static_cast<unsigned char>(text[start]);
        auto const length = text.size() - start;

        auto cp = char32_t { 0 };
        auto expected = std::size_t { 0 };
        if (lead < 0x80)
        {
            cp = lead;
            expected = 1;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            cp = lead & 0x1F;
            expected = 2;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            cp = lead & 0x0F;
            expected = 3;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            cp = lead & 0x07;
            expected = 4;
        }

        if (expected == 0 || expected != length)
            return 0;

        for (auto i = start + 1; i < text.size(); ++i)
            cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);

        return cp;
    }

    auto secondsOr(const nlohmann::json& obj, std::string_view key, double defaultValue) -> double
    {
        return json::getDoubleOr(obj, key, defaultValue);
    }

} // namespace

auto vowelClassOfKana(std::string_view moraText) -> std::optional<VowelClass>
{
    auto cp = lastCodepoint(moraText);
    if (cp >= KatakanaFirst && cp <= KatakanaLast)
        cp -= KatakanaToHiragana;

    if (cp == 0)
        return std::nullopt;
    if (RowA.find(cp) != std::u32string_view::npos)
        return VowelClass::Open;
    if (RowE.find(cp) != std::u32string_view::npos || RowO.find(cp) != std::u32string_view::npos)
        return VowelClass::Mid;
    if (RowI.find(cp) != std::u32string_view::npos || RowU.find(cp) != std::u32string_view::npos)
        return VowelClass::Closed;

    // ん, っ, ー and anything that is not kana.
    return std::nullopt;
}

auto timingFromJson(const nlohmann::json& segments) -> Result<std::vector<TimingSegment>>
{
    if (!segments.is_array())
        return makeError(ErrorCode::ProtocolError, "Timing data must be an array of segments");

    auto result = std::vector<TimingSegment> {};
    result.reserve(segments.size());

    for (auto const& entry: segments)
    {
        auto start = json::getNumber(entry, "startMs");
        if (!start)
            return std::unexpected(start.error());

        auto end = json::getNumber(entry, "endMs");
        if (!end)
            return std::unexpected(end.error());

        auto segment = TimingSegment {
            .text = json::getStringOr(entry, "text", ""),
            .vowelClass = std::nullopt,
            .startMs = *start,
            .endMs = *end,
        };

        if (entry.contains("vowel") && entry["vowel"].is_string())
            segment.vowelClass = vowelClassFromSymbol(entry["vowel"].get<std::string>());
        else
            segment.vowelClass = vowelClassOfKana(segment.text);

        result.push_back(std::move(segment));
    }

    return result;
}

auto timingFromAudioQuery(const nlohmann::json& query) -> Result<std::vector<TimingSegment>>
{
    if (!query.is_object() || !query.contains("accent_phrases") || !query["accent_phrases"].is_array())
        return makeError(ErrorCode::ProtocolError, "audio_query is missing accent_phrases");

    auto const speedScale = secondsOr(query, "speedScale", 1.0);
    if (speedScale <= 0.0)
        return makeError(ErrorCode::ProtocolError, std::format("Invalid speedScale: {}", speedScale));

    auto const toMs = [speedScale](double seconds) {
        return seconds / speedScale * MsPerSecond;
    };

    auto result = std::vector<TimingSegment> {};
    auto cursorMs = toMs(secondsOr(query, "prePhonemeLength", 0.0));

    for (auto const& phrase: query["accent_phrases"])
    {
        if (!phrase.is_object() || !phrase.contains("moras") || !phrase["moras"].is_array())
            continue;

        for (auto const& mora: phrase["moras"])
        {
            auto const lengthMs =
                toMs(secondsOr(mora, "consonant_length", 0.0) + secondsOr(mora, "vowel_length", 0.0));
            if (lengthMs <= 0.0)
                continue;

            auto const text = json::getStringOr(mora, "text", "");
            auto vowel = vowelClassFromSymbol(json::getStringOr(mora, "vowel", ""));
            if (!vowel && !mora.contains("vowel"))
                vowel = vowelClassOfKana(text);

            result.push_back(TimingSegment {
                .text = text,
                .vowelClass = vowel,
                .startMs = cursorMs,
                .endMs = cursorMs + lengthMs,
            });
            cursorMs += lengthMs;
        }

        // A pause between phrases keeps the mouth closed.
        if (phrase.contains("pause_mora") && phrase["pause_mora"].is_object())
            cursorMs += toMs(secondsOr(phrase["pause_mora"], "vowel_length", 0.0));
    }

    return result;
}

auto validateTiming(std::span<const TimingSegment> segments) -> VoidResult
{
    for (auto i = std::size_t { 0 }; i < segments.size(); ++i)
    {
        auto const& segment = segments[i];
        if (!(segment.startMs < segment.endMs))
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Timing segment {} ('{}') has startMs {} not before endMs {}",
                                         i,
                                         segment.text,
                                         segment.startMs,
                                         segment.endMs));

        if (i > 0 && segment.startMs < segments[i - 1].endMs)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Timing segment {} ('{}') starts at {} before the previous one ends at {}",
                                         i,
                                         segment.text,
                                         segment.startMs,
                                         segments[i - 1].endMs));
    }
    return {};
}

} // namespace manzai::timing
