// SPDX-License-Identifier: Apache-2.0
#include "Dialogue.hpp"

#include <core/JsonUtils.hpp>
#include <timing/TimingData.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace manzai
{

namespace
{

    auto lineError(std::size_t index, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::InvalidArgument, std::format("Dialogue line {}: {}", index, what));
    }

    auto parseLine(const nlohmann::json& entry, std::size_t index, const std::filesystem::path& baseDir)
        -> Result<AudioClip>
    {
        if (!entry.is_object())
            return lineError(index, "must be an object");

        auto const roleName = json::getStringOr(entry, "role", "");
        auto const role = performerFromString(roleName);
        if (!role)
            return lineError(index, std::format("unknown role '{}'", roleName));

        auto text = json::getString(entry, "text");
        if (!text)
            return lineError(index, "missing text");

        auto clip = AudioClip { .line = DialogueLine { .role = *role, .text = std::move(*text) } };

        auto const audio = json::getStringOr(entry, "audio", "");
        if (!audio.empty())
        {
            auto path = std::filesystem::path(audio);
            if (path.is_relative())
                path = baseDir / path;
            clip.audioRef = path.lexically_normal().string();
        }

        if (entry.contains("timing"))
        {
            auto timing = timing::timingFromJson(entry["timing"]);
            if (!timing)
                return lineError(index, timing.error().message);
            clip.timing = std::move(*timing);
        }
        else if (entry.contains("audioQuery"))
        {
            auto timing = timing::timingFromAudioQuery(entry["audioQuery"]);
            if (!timing)
                return lineError(index, timing.error().message);
            clip.timing = std::move(*timing);
        }

        return clip;
    }

} // namespace

auto dialogueFromJson(const nlohmann::json& doc, const std::filesystem::path& baseDir) -> Result<Dialogue>
{
    if (!doc.is_object() || !doc.contains("lines") || !doc["lines"].is_array())
        return makeError(ErrorCode::InvalidArgument, "Dialogue must be an object with a \"lines\" array");

    auto dialogue = Dialogue { .title = json::getStringOr(doc, "title", "") };
    auto const& lines = doc["lines"];
    dialogue.clips.reserve(lines.size());

    for (auto i = std::size_t { 0 }; i < lines.size(); ++i)
    {
        auto clip = parseLine(lines[i], i, baseDir);
        if (!clip)
            return std::unexpected(clip.error());
        dialogue.clips.push_back(std::move(*clip));
    }

    if (auto result = validateDialogue(dialogue.clips); !result)
        return std::unexpected(result.error());

    return dialogue;
}

auto loadDialogue(const std::filesystem::path& path) -> Result<Dialogue>
{
    auto file = std::ifstream(path);
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot open dialogue: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto doc = json::parse(ss.str());
    if (!doc)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Dialogue {} is not valid JSON: {}", path.string(), doc.error().message));

    return dialogueFromJson(*doc, path.parent_path());
}

auto validateDialogue(std::span<const AudioClip> clips) -> VoidResult
{
    if (clips.empty())
        return makeError(ErrorCode::InvalidArgument, "Dialogue has no lines");

    for (auto i = std::size_t { 0 }; i < clips.size(); ++i)
    {
        if (clips[i].line.text.empty())
            return lineError(i, "empty text");
        if (auto result = timing::validateTiming(clips[i].timing); !result)
            return lineError(i, result.error().message);
    }
    return {};
}

} // namespace manzai
