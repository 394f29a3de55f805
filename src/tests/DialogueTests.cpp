// SPDX-License-Identifier: Apache-2.0
#include <stage/Dialogue.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace manzai;

TEST_CASE("dialogueFromJson parses lines, roles and audio paths", "[dialogue]")
{
    auto const doc = nlohmann::json::parse(R"({
        "title": "Konbini",
        "lines": [
            { "role": "tsukkomi", "text": "Irasshaimase", "audio": "voices/../line0.wav",
              "timing": [ { "text": "い", "startMs": 0, "endMs": 90 } ] },
            { "role": "B", "text": "Hai", "audio": "/abs/line1.wav",
              "audioQuery": { "accent_phrases": [ { "moras": [ { "text": "ハ", "vowel": "a", "vowel_length": 0.1 } ] } ] } },
            { "role": "boke", "text": "Eh?" }
        ]
    })");

    auto result = dialogueFromJson(doc, "/shows/konbini");
    REQUIRE(result.has_value());

    auto const& dialogue = *result;
    CHECK(dialogue.title == "Konbini");
    REQUIRE(dialogue.clips.size() == 3);

    CHECK(dialogue.clips[0].line.role == Performer::Tsukkomi);
    CHECK(dialogue.clips[0].audioRef == "/shows/konbini/line0.wav");
    REQUIRE(dialogue.clips[0].timing.size() == 1);
    CHECK(dialogue.clips[0].timing[0].vowelClass == VowelClass::Closed);

    CHECK(dialogue.clips[1].line.role == Performer::Boke);
    CHECK(dialogue.clips[1].audioRef == "/abs/line1.wav");
    REQUIRE(dialogue.clips[1].timing.size() == 1);
    CHECK(dialogue.clips[1].timedDurationMs() > 99.0);

    CHECK(dialogue.clips[2].audioRef.empty());
    CHECK(dialogue.clips[2].timing.empty());
}

TEST_CASE("dialogueFromJson names the offending line", "[dialogue]")
{
    auto const expectError = [](std::string_view text, std::string_view fragment) {
        auto result = dialogueFromJson(nlohmann::json::parse(text), ".");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(result.error().message.find(fragment) != std::string::npos);
    };

    SECTION("unknown role")
    {
        expectError(R"({ "lines": [ { "role": "boke", "text": "a" }, { "role": "narrator", "text": "b" } ] })",
                    "line 1");
    }

    SECTION("missing text")
    {
        expectError(R"({ "lines": [ { "role": "boke" } ] })", "line 0");
    }

    SECTION("empty text")
    {
        expectError(R"({ "lines": [ { "role": "boke", "text": "" } ] })", "empty text");
    }

    SECTION("overlapping timing")
    {
        expectError(R"({ "lines": [ { "role": "boke", "text": "a", "timing": [
                            { "text": "a", "startMs": 0, "endMs": 100 },
                            { "text": "i", "startMs": 50, "endMs": 150 } ] } ] })",
                    "line 0");
    }

    SECTION("no lines")
    {
        expectError(R"({ "lines": [] })", "no lines");
    }

    SECTION("no lines array")
    {
        expectError(R"({ "title": "x" })", "lines");
    }
}

TEST_CASE("validateDialogue checks every clip", "[dialogue]")
{
    auto clips = std::vector<AudioClip> {
        AudioClip { .line = DialogueLine { .role = Performer::Tsukkomi, .text = "Doumo" } },
    };
    CHECK(validateDialogue(clips).has_value());

    clips.push_back(AudioClip { .line = DialogueLine { .role = Performer::Boke, .text = "" } });
    auto result = validateDialogue(clips);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);

    CHECK(!validateDialogue(std::vector<AudioClip> {}).has_value());
}

TEST_CASE("loadDialogue reads a manifest relative to its directory", "[dialogue]")
{
    auto const dir = std::filesystem::temp_directory_path() / "manzai_test_dialogue";
    std::filesystem::create_directories(dir);
    auto const path = dir / "dialogue.json";
    {
        auto file = std::ofstream(path);
        file << R"({ "lines": [ { "role": "A", "text": "Mou ee wa", "audio": "end.wav" } ] })";
    }

    auto result = loadDialogue(path);
    REQUIRE(result.has_value());
    REQUIRE(result->clips.size() == 1);
    CHECK(result->clips[0].audioRef == (dir / "end.wav").lexically_normal().string());

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadDialogue reports unreadable and invalid files", "[dialogue]")
{
    SECTION("missing file")
    {
        auto result = loadDialogue("/nonexistent/dialogue.json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::IoError);
    }

    SECTION("invalid JSON")
    {
        auto const path = std::filesystem::temp_directory_path() / "manzai_test_bad_dialogue.json";
        {
            auto file = std::ofstream(path);
            file << "{ lines: ";
        }

        auto result = loadDialogue(path);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);

        std::filesystem::remove(path);
    }
}
