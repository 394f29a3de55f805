// SPDX-License-Identifier: Apache-2.0
#include <audio/SimulatedAudioBackend.hpp>
#include <stage/PlaybackSequencer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <array>
#include <type_traits>
#include <vector>

#include "StageFakes.hpp"

using namespace manzai;
using manzai::test::FakeRenderSurface;
using manzai::test::ScriptedAudioBackend;
using manzai::test::timedClip;
using Catch::Matchers::WithinAbs;

namespace
{

using Step = std::pair<SessionState, int>;

/// @brief Records progress events and the distinct (state, line) steps they pass through.
struct ProgressLog
{
    std::vector<ProgressEvent> events;
    std::vector<Step> steps;

    auto observer() -> PlaybackSequencer::ProgressObserver
    {
        return [this](const ProgressEvent& event) {
            events.push_back(event);
            auto const step = Step { event.state, event.lineIndex };
            if (steps.empty() || steps.back() != step)
                steps.push_back(step);
        };
    }

    [[nodiscard]] auto count(SessionState state) const -> std::size_t
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(events, [state](auto const& e) { return e.state == state; }));
    }
};

/// @brief A stage with both characters loaded, driven by an audio backend of the test's choice.
template <typename Audio>
struct Stage
{
    EventLoop loop;
    FakeRenderSurface surface;
    RenderResourceManager renderer { loop, surface };
    Audio audio;
    PlaybackSequencer sequencer;
    ProgressLog log;

    explicit Stage(SequencerConfig config): audio(makeAudio(loop)), sequencer(loop, audio, renderer, config)
    {
        renderer.loadModel(Performer::Tsukkomi, "builtin:tsukkomi");
        renderer.loadModel(Performer::Boke, "builtin:boke");
        loop.step(0.0);
        sequencer.setObserver(log.observer());
    }

    static auto makeAudio(EventLoop& eventLoop) -> Audio
    {
        if constexpr (std::is_constructible_v<Audio, EventLoop&>)
            return Audio(eventLoop);
        else
            return Audio {};
    }
};

struct ScriptedStage: Stage<ScriptedAudioBackend>
{
    ScriptedStage(): Stage(SequencerConfig { .transitionPauseMs = 100.0 }) {}
};

struct SimulatedStage: Stage<SimulatedAudioBackend>
{
    SimulatedStage(): Stage(SequencerConfig { .transitionPauseMs = 100.0 }) {}
};

auto threeLines() -> std::vector<AudioClip>
{
    return {
        timedClip(Performer::Tsukkomi, "one", 200.0),
        timedClip(Performer::Boke, "two", 300.0),
        timedClip(Performer::Tsukkomi, "three", 100.0),
    };
}

} // namespace

TEST_CASE("sessionStateToString and sessionStateFromString agree", "[sequencer]")
{
    for (auto const state: { SessionState::Idle,
                             SessionState::LinePlaying,
                             SessionState::LineTransition,
                             SessionState::Finished,
                             SessionState::Stopped,
                             SessionState::Failed })
        CHECK(sessionStateFromString(sessionStateToString(state)) == state);

    CHECK(sessionStateToString(SessionState::LinePlaying) == "playing");
    CHECK(!sessionStateFromString("rehearsing").has_value());
}

TEST_CASE("PlaybackSequencer performs every line in order and finishes", "[sequencer]")
{
    auto stage = SimulatedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.loop.advance(2000.0, 10.0);

    auto const expected = std::vector<Step> {
        { SessionState::LinePlaying, 0 },    { SessionState::LineTransition, 0 },
        { SessionState::LinePlaying, 1 },    { SessionState::LineTransition, 1 },
        { SessionState::LinePlaying, 2 },    { SessionState::LineTransition, 2 },
        { SessionState::Finished, -1 },
    };
    CHECK(stage.log.steps == expected);
    CHECK(stage.sequencer.state() == SessionState::Finished);
    CHECK(stage.sequencer.cursor() == -1);
    CHECK(stage.sequencer.session().failures.empty());
    CHECK(stage.sequencer.mouths() == MouthState { 0.0f, 0.0f });
    CHECK(stage.log.count(SessionState::Finished) == 1);
}

TEST_CASE("PlaybackSequencer only moves the mouth of the speaking performer", "[sequencer]")
{
    auto stage = SimulatedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.loop.advance(2000.0, 10.0);

    auto spoke = std::array<bool, PerformerCount> {};
    for (auto const& event: stage.log.events)
    {
        if (event.state != SessionState::LinePlaying)
        {
            // Line boundaries always close both mouths.
            CHECK(event.mouths == MouthState { 0.0f, 0.0f });
            continue;
        }
        REQUIRE(event.role.has_value());
        auto const speaker = performerIndex(*event.role);
        auto const listener = 1 - speaker;
        CHECK(event.mouths[listener] == 0.0f);
        if (event.mouths[speaker] > 0.0f)
            spoke[speaker] = true;
    }
    CHECK(spoke[0]);
    CHECK(spoke[1]);
}

TEST_CASE("PlaybackSequencer drives the mouth from the audio position", "[sequencer]")
{
    auto stage = ScriptedStage {};
    auto clip = AudioClip { .line = DialogueLine { .role = Performer::Boke, .text = "nande ya nen" } };
    clip.timing.push_back(TimingSegment { .text = "な", .vowelClass = VowelClass::Open, .startMs = 100.0, .endMs = 150.0 });
    REQUIRE(stage.sequencer.load({ clip }).has_value());

    stage.sequencer.play();
    REQUIRE(stage.audio.playbacks.size() == 1);
    auto& playback = stage.audio.last();
    CHECK(playback.started);
    CHECK(stage.sequencer.state() == SessionState::LinePlaying);

    playback.events.onStarted();

    playback.elapsedMs = 120.0;
    stage.loop.step(16.0);
    CHECK(stage.sequencer.mouths()[performerIndex(Performer::Boke)] == 1.0f);
    CHECK(stage.sequencer.mouths()[performerIndex(Performer::Tsukkomi)] == 0.0f);
    CHECK_THAT(stage.renderer.openness(Performer::Boke), WithinAbs(1.0, 1e-6));

    playback.elapsedMs = 151.0;
    stage.loop.step(16.0);
    CHECK(stage.sequencer.mouths()[performerIndex(Performer::Boke)] == 0.0f);

    playback.elapsedMs = 99.0;
    stage.loop.step(16.0);
    CHECK(stage.sequencer.mouths()[performerIndex(Performer::Boke)] == 0.0f);
}

TEST_CASE("PlaybackSequencer closes all mouths when a line ends", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    auto& playback = stage.audio.last();
    playback.events.onStarted();
    playback.elapsedMs = 50.0;
    stage.loop.step(16.0);
    REQUIRE(stage.sequencer.mouths()[performerIndex(Performer::Tsukkomi)] > 0.0f);

    playback.events.onEnded();

    CHECK(stage.sequencer.state() == SessionState::LineTransition);
    CHECK(stage.sequencer.cursor() == 0);
    CHECK(stage.sequencer.mouths() == MouthState { 0.0f, 0.0f });
    CHECK(stage.renderer.openness(Performer::Tsukkomi) == 0.0f);

    SECTION("the next line starts after the pause")
    {
        stage.loop.step(99.0);
        CHECK(stage.sequencer.state() == SessionState::LineTransition);
        CHECK(stage.audio.playbacks.size() == 1);

        stage.loop.step(1.0);
        CHECK(stage.sequencer.state() == SessionState::LinePlaying);
        CHECK(stage.sequencer.cursor() == 1);
        REQUIRE(stage.audio.playbacks.size() == 2);
        CHECK(stage.audio.last().text == "two");
    }
}

TEST_CASE("PlaybackSequencer skips lines whose audio cannot be opened", "[sequencer]")
{
    auto stage = ScriptedStage {};
    stage.audio.unreadable.insert("two");
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.audio.last().events.onEnded();
    stage.loop.step(100.0);

    CHECK(stage.sequencer.state() == SessionState::LineTransition);
    CHECK(stage.sequencer.cursor() == 1);
    REQUIRE(stage.sequencer.session().failures.size() == 1);
    CHECK(stage.sequencer.session().failures[0].lineIndex == 1);
    CHECK(stage.sequencer.session().failures[0].error.code == ErrorCode::AudioLoadError);

    stage.loop.step(100.0);
    CHECK(stage.sequencer.state() == SessionState::LinePlaying);
    CHECK(stage.sequencer.cursor() == 2);
    CHECK(stage.audio.last().text == "three");

    stage.audio.last().events.onEnded();
    stage.loop.step(100.0);
    CHECK(stage.sequencer.state() == SessionState::Finished);
}

TEST_CASE("PlaybackSequencer skips lines whose playback fails", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.audio.last().events.onStarted();
    stage.audio.last().events.onError(Error { ErrorCode::AudioPlaybackError, "device vanished" });

    CHECK(stage.sequencer.state() == SessionState::LineTransition);
    REQUIRE(stage.sequencer.session().failures.size() == 1);
    CHECK(stage.sequencer.session().failures[0].error.code == ErrorCode::AudioPlaybackError);

    stage.loop.step(100.0);
    CHECK(stage.sequencer.cursor() == 1);
}

TEST_CASE("PlaybackSequencer continues to the end after a mid-dialogue playback error", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.audio.last().events.onStarted();
    stage.audio.last().events.onEnded();
    stage.loop.step(100.0);
    REQUIRE(stage.sequencer.cursor() == 1);

    stage.audio.last().events.onStarted();
    stage.audio.last().events.onError(Error { ErrorCode::AudioPlaybackError, "underrun" });
    CHECK(stage.sequencer.state() == SessionState::LineTransition);
    CHECK(stage.sequencer.mouths() == MouthState { 0.0f, 0.0f });

    stage.loop.step(100.0);
    REQUIRE(stage.sequencer.cursor() == 2);
    stage.audio.last().events.onStarted();
    stage.audio.last().events.onEnded();
    stage.loop.step(100.0);

    CHECK(stage.sequencer.state() == SessionState::Finished);

    auto const expected = std::vector<Step> {
        { SessionState::LinePlaying, 0 },    { SessionState::LineTransition, 0 },
        { SessionState::LinePlaying, 1 },    { SessionState::LineTransition, 1 },
        { SessionState::LinePlaying, 2 },    { SessionState::LineTransition, 2 },
        { SessionState::Finished, -1 },
    };
    CHECK(stage.log.steps == expected);

    REQUIRE(stage.audio.playbacks.size() == 3);
    CHECK(stage.audio.playbacks[0]->text == "one");
    CHECK(stage.audio.playbacks[2]->text == "three");

    auto const& failures = stage.sequencer.session().failures;
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].lineIndex == 1);
    CHECK(failures[0].error.code == ErrorCode::AudioPlaybackError);
}

TEST_CASE("PlaybackSequencer stop halts immediately and is idempotent", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    auto& playback = stage.audio.last();
    playback.events.onStarted();
    playback.elapsedMs = 50.0;
    stage.loop.step(16.0);

    stage.sequencer.stop();

    CHECK(stage.sequencer.state() == SessionState::Stopped);
    CHECK(stage.sequencer.cursor() == -1);
    CHECK(stage.sequencer.mouths() == MouthState { 0.0f, 0.0f });
    CHECK(playback.stopped);
    CHECK(stage.log.count(SessionState::Stopped) == 1);

    auto const eventCount = stage.log.events.size();
    stage.sequencer.stop();
    stage.loop.advance(1000.0, 16.0);

    CHECK(stage.log.events.size() == eventCount);
    CHECK(stage.sequencer.state() == SessionState::Stopped);
    CHECK(stage.audio.playbacks.size() == 1);
}

TEST_CASE("PlaybackSequencer stop without a performance does nothing", "[sequencer]")
{
    auto stage = ScriptedStage {};
    stage.sequencer.stop();
    CHECK(stage.sequencer.state() == SessionState::Idle);
    CHECK(stage.log.events.empty());
}

TEST_CASE("PlaybackSequencer stop during the pause cancels the next line", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.audio.last().events.onEnded();
    REQUIRE(stage.sequencer.state() == SessionState::LineTransition);

    stage.sequencer.stop();
    stage.loop.advance(1000.0, 16.0);

    CHECK(stage.sequencer.state() == SessionState::Stopped);
    CHECK(stage.audio.playbacks.size() == 1);
}

TEST_CASE("PlaybackSequencer ignores completions from a stopped performance", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    auto stale = stage.audio.playbacks.front();
    stage.sequencer.stop();
    auto const eventCount = stage.log.events.size();

    stale->events.onStarted();
    stale->elapsedMs = 50.0;
    stage.loop.step(16.0);
    stale->events.onEnded();
    stale->events.onError(Error { ErrorCode::AudioPlaybackError, "late" });
    stage.loop.step(500.0);

    CHECK(stage.sequencer.state() == SessionState::Stopped);
    CHECK(stage.log.events.size() == eventCount);
    CHECK(stage.sequencer.mouths() == MouthState { 0.0f, 0.0f });

    SECTION("a restarted performance is not affected either")
    {
        stage.sequencer.play();
        REQUIRE(stage.audio.playbacks.size() == 2);
        CHECK(stage.sequencer.cursor() == 0);

        stale->events.onEnded();
        CHECK(stage.sequencer.state() == SessionState::LinePlaying);

        stage.audio.last().events.onEnded();
        CHECK(stage.sequencer.state() == SessionState::LineTransition);
    }
}

TEST_CASE("PlaybackSequencer play while performing is ignored", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    stage.sequencer.play();
    stage.audio.last().events.onStarted();
    stage.audio.last().events.onEnded();
    stage.loop.step(100.0);
    REQUIRE(stage.sequencer.state() == SessionState::LinePlaying);
    REQUIRE(stage.sequencer.cursor() == 1);
    REQUIRE(stage.audio.playbacks.size() == 2);

    auto const epoch = stage.sequencer.epoch();

    SECTION("while a line is playing")
    {
        auto const eventCount = stage.log.events.size();
        stage.sequencer.play();

        CHECK(stage.sequencer.state() == SessionState::LinePlaying);
        CHECK(stage.sequencer.cursor() == 1);
        CHECK(stage.log.events.size() == eventCount);

        stage.audio.last().events.onEnded();
    }

    SECTION("during the pause after a line")
    {
        stage.audio.last().events.onEnded();
        REQUIRE(stage.sequencer.state() == SessionState::LineTransition);

        auto const eventCount = stage.log.events.size();
        stage.sequencer.play();

        CHECK(stage.sequencer.state() == SessionState::LineTransition);
        CHECK(stage.sequencer.cursor() == 1);
        CHECK(stage.log.events.size() == eventCount);
    }

    CHECK(stage.sequencer.epoch() == epoch);
    CHECK(stage.audio.playbacks.size() == 2);
    CHECK(stage.audio.last().text == "two");
    CHECK(!stage.audio.last().stopped);

    stage.loop.step(100.0);
    CHECK(stage.sequencer.cursor() == 2);
    CHECK(stage.audio.last().text == "three");
}

TEST_CASE("PlaybackSequencer rejects loading while performing", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());
    stage.sequencer.play();

    auto result = stage.sequencer.load(threeLines());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidState);
    CHECK(stage.sequencer.state() == SessionState::LinePlaying);
}

TEST_CASE("PlaybackSequencer play without a dialogue does nothing", "[sequencer]")
{
    auto stage = ScriptedStage {};
    stage.sequencer.play();
    CHECK(stage.sequencer.state() == SessionState::Idle);
    CHECK(stage.audio.playbacks.empty());
}

TEST_CASE("PlaybackSequencer tolerates an observer stopping the performance", "[sequencer]")
{
    auto stage = ScriptedStage {};
    REQUIRE(stage.sequencer.load(threeLines()).has_value());

    auto inner = stage.log.observer();
    stage.sequencer.setObserver([&](const ProgressEvent& event) {
        inner(event);
        if (event.state == SessionState::LinePlaying)
            stage.sequencer.stop();
    });

    stage.sequencer.play();

    CHECK(stage.sequencer.state() == SessionState::Stopped);
    CHECK(stage.audio.playbacks.empty());
    CHECK(stage.log.steps == std::vector<Step> { { SessionState::LinePlaying, 0 }, { SessionState::Stopped, -1 } });
}

TEST_CASE("PlaybackSequencer can replay a finished dialogue", "[sequencer]")
{
    auto stage = SimulatedStage {};
    REQUIRE(stage.sequencer.load({ timedClip(Performer::Boke, "once more", 50.0) }).has_value());

    stage.sequencer.play();
    stage.loop.advance(500.0, 10.0);
    REQUIRE(stage.sequencer.state() == SessionState::Finished);

    stage.sequencer.play();
    CHECK(stage.sequencer.state() == SessionState::LinePlaying);
    stage.loop.advance(500.0, 10.0);
    CHECK(stage.sequencer.state() == SessionState::Finished);
    CHECK(stage.log.count(SessionState::Finished) == 2);
}
