// SPDX-License-Identifier: Apache-2.0
#include <render/CharacterModel.hpp>
#include <render/RendererHandle.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <filesystem>
#include <fstream>

using namespace manzai;
using Catch::Matchers::WithinAbs;

TEST_CASE("builtinCharacterModel provides the standard parameters", "[model]")
{
    for (auto const performer: AllPerformers)
    {
        auto const model = builtinCharacterModel(performer);
        CHECK(!model.name.empty());
        CHECK(model.mouthParameter == param::MouthOpen);
        CHECK(model.parameters.contains(param::MouthOpen));
        CHECK(model.parameters.contains(param::EyeOpen));
        CHECK(model.parameters.contains(param::Breath));
    }

    CHECK(builtinCharacterModel(Performer::Tsukkomi).name == "Tsukkomi");
    CHECK(builtinCharacterModel(Performer::Boke).name == "Boke");
}

TEST_CASE("builtinModelRef names the built-in model of a performer", "[model]")
{
    CHECK(builtinModelRef(Performer::Tsukkomi) == "builtin:tsukkomi");
    CHECK(builtinModelRef(Performer::Boke) == "builtin:boke");
}

TEST_CASE("loadCharacterModel resolves built-in references", "[model]")
{
    auto result = loadCharacterModel("builtin:boke");
    REQUIRE(result.has_value());
    CHECK(result->name == "Boke");

    auto unknown = loadCharacterModel("builtin:nobody");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ModelLoadError);
}

TEST_CASE("loadCharacterModel fails for empty and missing references", "[model]")
{
    auto empty = loadCharacterModel("");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::ModelLoadError);

    auto missing = loadCharacterModel("/nonexistent/model.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ModelLoadError);
}

TEST_CASE("characterModelFromJson parses a custom model", "[model]")
{
    auto const doc = nlohmann::json::parse(R"({
        "name": "Hiro",
        "mouthParameter": "ParamMouthA",
        "parameters": {
            "ParamMouthA": { "min": 0, "max": 2, "default": 0 },
            "ParamAngleX": { "min": -30, "max": 30, "default": 50 }
        },
        "idle": { "breathPeriodMs": 2000, "blinkIntervalMs": 0 },
        "face": { "eyes": "*   *", "mouths": [ ".", "o", "O" ] },
        "color": [ 10, 20, 300 ]
    })");

    auto result = characterModelFromJson(doc);
    REQUIRE(result.has_value());

    auto const& model = *result;
    CHECK(model.name == "Hiro");
    CHECK(model.mouthParameter == "ParamMouthA");
    CHECK(model.parameters.at("ParamMouthA").max == 2.0f);
    CHECK(model.parameters.at("ParamAngleX").defaultValue == 30.0f);
    CHECK(model.parameters.contains(param::EyeOpen));
    CHECK(model.idle.breathPeriodMs == 2000.0);
    CHECK(model.idle.blinkIntervalMs == 0.0);
    CHECK(model.face.eyes == "*   *");
    CHECK(model.face.mouths[2] == "O");
    CHECK(model.color[2] == 255);
}

TEST_CASE("characterModelFromJson rejects invalid models", "[model]")
{
    SECTION("missing name")
    {
        auto result = characterModelFromJson(nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ModelLoadError);
    }

    SECTION("empty parameter range")
    {
        auto result = characterModelFromJson(
            nlohmann::json::parse(R"({ "name": "x", "parameters": { "P": { "min": 1, "max": 1 } } })"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ModelLoadError);
    }

    SECTION("wrong number of mouth shapes")
    {
        auto result = characterModelFromJson(
            nlohmann::json::parse(R"({ "name": "x", "face": { "mouths": [ "-", "o" ] } })"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ModelLoadError);
    }
}

TEST_CASE("loadCharacterModel reads a model file", "[model]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "manzai_test_model.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "name": "FromFile" })";
    }

    auto result = loadCharacterModel(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->name == "FromFile");

    std::filesystem::remove(tempPath);
}

TEST_CASE("RendererHandle places each performer on its side", "[renderer]")
{
    auto const tsukkomi = makeRenderer(
        Performer::Tsukkomi, "builtin:tsukkomi", builtinCharacterModel(Performer::Tsukkomi), 1, RendererSettings {});
    auto const boke =
        makeRenderer(Performer::Boke, "builtin:boke", builtinCharacterModel(Performer::Boke), 2, RendererSettings {});

    REQUIRE(tsukkomi);
    REQUIRE(boke);
    CHECK(tsukkomi->side() == StageSide::Left);
    CHECK(boke->side() == StageSide::Right);
    CHECK(tsukkomi->performer() == Performer::Tsukkomi);
    CHECK(boke->resourceId() == 2);
    CHECK(boke->modelRef() == "builtin:boke");
}

TEST_CASE("RendererHandle maps the mouthOpen alias onto the mouth parameter range", "[renderer]")
{
    auto model = builtinCharacterModel(Performer::Tsukkomi);
    model.parameters.insert_or_assign(std::string(param::MouthOpen), ParameterRange { .min = 0.0f, .max = 2.0f });
    auto const handle = makeRenderer(Performer::Tsukkomi, "custom", std::move(model), 1, RendererSettings {});

    CHECK(handle->setParameter(MouthOpenAlias, 0.5f));
    CHECK_THAT(*handle->parameter(param::MouthOpen), WithinAbs(1.0, 1e-6));
    CHECK_THAT(handle->currentOpenness(), WithinAbs(0.5, 1e-6));

    SECTION("values are clamped")
    {
        CHECK(handle->setParameter(MouthOpenAlias, 3.0f));
        CHECK(handle->currentOpenness() == 1.0f);

        CHECK(handle->setParameter(param::MouthOpen, -1.0f));
        CHECK(*handle->parameter(param::MouthOpen) == 0.0f);
    }

    SECTION("unknown parameters are rejected")
    {
        CHECK(!handle->setParameter("ParamDoesNotExist", 1.0f));
        CHECK(!handle->parameter("ParamDoesNotExist").has_value());
    }
}

TEST_CASE("RendererHandle smooths the displayed mouth toward the set value", "[renderer]")
{
    auto const handle = makeRenderer(Performer::Tsukkomi,
                                     "builtin:tsukkomi",
                                     builtinCharacterModel(Performer::Tsukkomi),
                                     1,
                                     RendererSettings { .smoothingMs = 60.0 });

    handle->setParameter(MouthOpenAlias, 1.0f);
    handle->tick(16.0);
    CHECK(handle->displayedOpenness() > 0.0f);
    CHECK(handle->displayedOpenness() < 1.0f);
    CHECK(handle->pose().mouthOpen == handle->displayedOpenness());

    for (auto i = 0; i < 100; ++i)
        handle->tick(16.0);
    CHECK(handle->displayedOpenness() == 1.0f);
}

TEST_CASE("RendererHandle without smoothing shows the set value on the next tick", "[renderer]")
{
    auto const handle = makeRenderer(Performer::Boke,
                                     "builtin:boke",
                                     builtinCharacterModel(Performer::Boke),
                                     1,
                                     RendererSettings { .smoothingMs = 0.0 });

    handle->setParameter(MouthOpenAlias, 0.7f);
    handle->tick(16.0);
    CHECK_THAT(handle->displayedOpenness(), WithinAbs(0.7, 1e-6));
}

TEST_CASE("RendererHandle animates blinking and swaying while idle", "[renderer]")
{
    auto const tsukkomi = makeRenderer(Performer::Tsukkomi,
                                       "builtin:tsukkomi",
                                       builtinCharacterModel(Performer::Tsukkomi),
                                       1,
                                       RendererSettings {});
    auto const boke =
        makeRenderer(Performer::Boke, "builtin:boke", builtinCharacterModel(Performer::Boke), 2, RendererSettings {});

    tsukkomi->tick(100.0);
    CHECK(tsukkomi->pose().eyeOpen == 1.0f);

    // The built-in tsukkomi blinks in the last 150 ms of every 3500 ms.
    tsukkomi->tick(3300.0);
    CHECK(tsukkomi->pose().eyeOpen == 0.0f);
    CHECK(tsukkomi->pose().offset == 0);

    boke->tick(600.0);
    CHECK(boke->pose().offset == 1);
}

TEST_CASE("RendererHandle tracks whether it needs redrawing", "[renderer]")
{
    auto const handle = makeRenderer(Performer::Tsukkomi,
                                     "builtin:tsukkomi",
                                     builtinCharacterModel(Performer::Tsukkomi),
                                     1,
                                     RendererSettings {});
    CHECK(handle->isDirty());

    handle->clearDirty();
    handle->setParameter(MouthOpenAlias, 0.0f);
    CHECK(!handle->isDirty());

    handle->setParameter(MouthOpenAlias, 0.4f);
    CHECK(handle->isDirty());
}
