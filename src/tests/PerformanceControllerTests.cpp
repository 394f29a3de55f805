// SPDX-License-Identifier: Apache-2.0
#include <audio/SimulatedAudioBackend.hpp>
#include <stage/MirrorDisplay.hpp>
#include <stage/PerformanceController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <vector>

#include "StageFakes.hpp"

using namespace manzai;
using manzai::test::FakeDisplaySurface;
using manzai::test::FakeRenderSurface;
using manzai::test::timedClip;

namespace
{

struct Fixture
{
    EventLoop loop;
    FakeRenderSurface surface;
    RenderResourceManager renderer { loop, surface };
    SimulatedAudioBackend audio { loop };
    PerformanceController controller { loop, audio, renderer, SequencerConfig { .transitionPauseMs = 100.0 } };
    std::vector<ProgressEvent> events;

    Fixture()
    {
        controller.setObserver([this](const ProgressEvent& event) { events.push_back(event); });
    }

    void loadBoth()
    {
        controller.loadCharacter(Performer::Tsukkomi, "builtin:tsukkomi");
        controller.loadCharacter(Performer::Boke, "builtin:boke");
    }

    [[nodiscard]] auto lastState() const -> SessionState { return events.back().state; }
};

auto dialogue() -> std::vector<AudioClip>
{
    return {
        timedClip(Performer::Tsukkomi, "Doumo", 150.0),
        timedClip(Performer::Boke, "Yoroshiku", 250.0),
    };
}

} // namespace

TEST_CASE("PerformanceController waits for character loads before playing", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());

    f.controller.play();
    CHECK(f.controller.pendingLoads() == 2);
    CHECK(f.controller.state() == SessionState::Idle);
    CHECK(f.events.empty());

    f.loop.step(0.0);
    CHECK(f.controller.pendingLoads() == 0);
    CHECK(f.controller.state() == SessionState::LinePlaying);
    CHECK(f.controller.sequencer().cursor() == 0);
}

TEST_CASE("PerformanceController performs a dialogue to the end", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.startRendering();
    f.controller.play();

    f.loop.advance(2000.0, 10.0);

    CHECK(f.controller.state() == SessionState::Finished);
    CHECK(f.controller.isDone());
    REQUIRE(!f.events.empty());
    CHECK(f.lastState() == SessionState::Finished);
    CHECK(f.surface.frames > 0);

    f.controller.stopRendering();
    auto const frames = f.surface.frames;
    f.loop.step(16.0);
    CHECK(f.surface.frames == frames);
}

TEST_CASE("PerformanceController reports an invalid dialogue as Failed", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    f.loop.step(0.0);

    auto result = f.controller.load({});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);

    CHECK(f.controller.state() == SessionState::Failed);
    CHECK(f.controller.isDone());
    REQUIRE(f.events.size() == 1);
    CHECK(f.events[0].state == SessionState::Failed);
    CHECK(!f.events[0].text.empty());

    f.controller.play();
    f.loop.step(16.0);
    CHECK(f.controller.state() == SessionState::Failed);

    SECTION("a valid dialogue recovers")
    {
        REQUIRE(f.controller.load(dialogue()).has_value());
        CHECK(f.controller.state() == SessionState::Idle);
        f.controller.play();
        CHECK(f.controller.state() == SessionState::LinePlaying);
    }
}

TEST_CASE("PerformanceController fails when no character can be loaded", "[controller]")
{
    auto f = Fixture {};
    f.surface.context = false;
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();

    f.loop.step(0.0);

    CHECK(f.controller.state() == SessionState::Failed);
    REQUIRE(!f.events.empty());
    CHECK(f.lastState() == SessionState::Failed);
    CHECK(f.events.back().text == "no character could be loaded");

    SECTION("a character loaded later allows playing")
    {
        f.surface.context = true;
        f.controller.loadCharacter(Performer::Tsukkomi, "builtin:tsukkomi");
        f.loop.step(0.0);

        CHECK(f.renderer.isLoaded(Performer::Tsukkomi));
        CHECK(f.controller.state() == SessionState::Idle);

        f.controller.play();
        CHECK(f.controller.state() == SessionState::LinePlaying);
    }

    SECTION("playing again without a character fails again")
    {
        auto const failures = f.events.size();
        f.controller.play();

        CHECK(f.controller.state() == SessionState::Failed);
        CHECK(f.events.size() == failures + 1);
    }
}

TEST_CASE("PerformanceController keeps an invalid dialogue failed after a character load", "[controller]")
{
    auto f = Fixture {};
    static_cast<void>(f.controller.load({}));
    REQUIRE(f.controller.state() == SessionState::Failed);

    f.controller.loadCharacter(Performer::Tsukkomi, "builtin:tsukkomi");
    f.loop.step(0.0);
    f.controller.play();
    f.loop.step(16.0);

    CHECK(f.controller.state() == SessionState::Failed);
    CHECK(f.events.size() == 1);
}

TEST_CASE("PerformanceController performs with a single character", "[controller]")
{
    auto f = Fixture {};
    f.controller.loadCharacter(Performer::Tsukkomi, "builtin:tsukkomi");
    f.controller.loadCharacter(Performer::Boke, "builtin:nobody");
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();

    f.loop.advance(2000.0, 10.0);

    CHECK(!f.renderer.isLoaded(Performer::Boke));
    CHECK(f.controller.state() == SessionState::Finished);
}

TEST_CASE("PerformanceController stop ends the performance", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();
    f.loop.advance(50.0, 10.0);
    REQUIRE(f.controller.state() == SessionState::LinePlaying);

    f.controller.stop();

    CHECK(f.controller.state() == SessionState::Stopped);
    CHECK(f.controller.isDone());
    CHECK(f.lastState() == SessionState::Stopped);
}

TEST_CASE("PerformanceController stop before the characters are loaded cancels the start", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();
    f.controller.stop();

    f.loop.advance(500.0, 10.0);
    CHECK(f.controller.state() == SessionState::Idle);
    CHECK(f.events.empty());
}

TEST_CASE("PerformanceController rejects loading while performing", "[controller]")
{
    auto f = Fixture {};
    f.loadBoth();
    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();
    f.loop.step(0.0);

    auto result = f.controller.load(dialogue());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidState);
}

TEST_CASE("PerformanceController mirrors the performance into a display", "[controller][mirror]")
{
    auto f = Fixture {};
    f.loadBoth();
    auto display = std::make_shared<FakeDisplaySurface>();
    f.controller.attachMirror(display);

    REQUIRE(!display->messages.empty());
    CHECK(display->messages[0]["type"] == "SNAPSHOT");
    CHECK(display->messages[0]["payload"]["models"]["tsukkomi"] == "builtin:tsukkomi");

    REQUIRE(f.controller.load(dialogue()).has_value());
    f.controller.play();
    f.loop.advance(2000.0, 10.0);
    REQUIRE(f.controller.state() == SessionState::Finished);

    // Replaying the messages on a second stage reproduces the final state.
    auto mirrorLoop = EventLoop {};
    auto mirrorSurface = FakeRenderSurface {};
    auto mirrorRenderer = RenderResourceManager(mirrorLoop, mirrorSurface);
    auto mirrorDisplay = MirrorDisplay(mirrorRenderer);
    for (auto const& message: display->messages)
        REQUIRE(mirrorDisplay.handleMessage(message).has_value());
    mirrorLoop.step(0.0);

    CHECK(mirrorDisplay.state().state == SessionState::Finished);
    CHECK(mirrorDisplay.state().lineIndex == -1);
    CHECK(mirrorRenderer.isLoaded(Performer::Tsukkomi));
    CHECK(mirrorRenderer.isLoaded(Performer::Boke));
}

TEST_CASE("PerformanceController is unaffected by a display closing mid-performance", "[controller][mirror]")
{
    auto stateSequence = [](bool closeDisplay) {
        auto f = Fixture {};
        f.loadBoth();
        auto display = std::make_shared<FakeDisplaySurface>();
        f.controller.attachMirror(display);
        REQUIRE(f.controller.load(dialogue()).has_value());
        f.controller.play();

        f.loop.advance(200.0, 10.0);
        if (closeDisplay)
        {
            display->close();
            CHECK(!f.controller.bridge().isConnected());
        }
        f.loop.advance(1800.0, 10.0);

        auto states = std::vector<std::pair<SessionState, int>> {};
        for (auto const& event: f.events)
        {
            auto const step = std::pair { event.state, event.lineIndex };
            if (states.empty() || states.back() != step)
                states.push_back(step);
        }
        return states;
    };

    auto const withDisplay = stateSequence(false);
    auto const closedMidway = stateSequence(true);

    CHECK(closedMidway == withDisplay);
    REQUIRE(!closedMidway.empty());
    CHECK(closedMidway.back().first == SessionState::Finished);
}

TEST_CASE("PerformanceController forwards Failed to the mirror", "[controller][mirror]")
{
    auto f = Fixture {};
    auto display = std::make_shared<FakeDisplaySurface>();
    f.controller.attachMirror(display);

    static_cast<void>(f.controller.load({}));

    REQUIRE(display->messages.size() == 2);
    CHECK(display->messages[1]["type"] == "STATE_UPDATE");
    CHECK(display->messages[1]["payload"]["state"] == "failed");
    CHECK(f.controller.bridge().lastKnownState().state == SessionState::Failed);
}
