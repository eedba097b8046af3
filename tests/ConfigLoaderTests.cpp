#include "bonk/utils/Config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using Catch::Matchers::WithinAbs;
using bonk::utils::ConfigLoader;

namespace {

struct TempConfigFile {
    std::filesystem::path path;

    explicit TempConfigFile(const std::string& contents)
        : path(std::filesystem::temp_directory_path() / "bonk_config_test.json") {
        std::ofstream file(path);
        file << contents;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

TEST_CASE("ConfigLoader reads every section", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "time": {
            "fixedDeltaTime": 0.02,
            "timeScale": 0.5,
            "fixedStepMode": "accumulated",
            "maxFixedStepsPerFrame": 8
        },
        "physics": {
            "backend": "jolt",
            "gravity": [0, 500],
            "pixelsPerUnit": 32,
            "maxBodies": 1024,
            "collisionLayers": ["player", "enemy"]
        },
        "logging": { "debug": true, "file": "logs/bonk.log" }
    })", "/games/demo");

    REQUIRE(result.loadedFromFile);
    CHECK_FALSE(result.HasErrors());
    CHECK_FALSE(result.HasWarnings());

    const auto& config = result.config;
    CHECK_THAT(config.time.fixedDeltaTime, WithinAbs(0.02f, 1e-6));
    CHECK_THAT(config.time.timeScale, WithinAbs(0.5f, 1e-6));
    CHECK(config.time.fixedStepMode == bonk::FixedStepMode::Accumulated);
    CHECK(config.time.maxFixedStepsPerFrame == 8);
    CHECK(config.physics.gravity == bonk::Vector2(0.0f, 500.0f));
    CHECK(config.physics.pixelsPerUnit == 32.0f);
    CHECK(config.physics.maxBodies == 1024u);
    CHECK(config.physics.collisionLayers == std::vector<std::string>{"player", "enemy"});
    CHECK(config.logging.debug);
    CHECK(config.logging.file == std::filesystem::path("/games/demo/logs/bonk.log"));

    const auto settings = config.ToSceneSettings();
    CHECK(settings.fixedStepMode == bonk::FixedStepMode::Accumulated);
    CHECK(settings.pixelsPerUnit == 32.0f);
    CHECK(settings.collisionLayers.size() == 2);
}

TEST_CASE("ConfigLoader fills missing sections with defaults", "[config]") {
    const auto result = ConfigLoader::LoadFromString("{}");

    REQUIRE(result.loadedFromFile);
    CHECK_FALSE(result.HasErrors());
    CHECK(result.config.physics.backend == "jolt");
    CHECK(result.config.time.fixedStepMode == bonk::FixedStepMode::PerFrame);
    CHECK(result.config.time.maxFixedStepsPerFrame == 5);
    CHECK(result.config.logging.file.empty());
}

TEST_CASE("ConfigLoader reports malformed JSON", "[config]") {
    const auto result = ConfigLoader::LoadFromString("{ \"time\": ");

    CHECK_FALSE(result.loadedFromFile);
    CHECK(result.HasErrors());
    CHECK(result.config.physics.backend == "jolt");
}

TEST_CASE("ConfigLoader rejects a non-object root", "[config]") {
    const auto result = ConfigLoader::LoadFromString("[1, 2, 3]");

    CHECK_FALSE(result.loadedFromFile);
    CHECK(result.HasErrors());
}

TEST_CASE("ConfigLoader clamps invalid time values", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "time": { "fixedDeltaTime": 0, "timeScale": -2, "maxFixedStepsPerFrame": 500, "fixedStepMode": "sometimes" }
    })");

    CHECK(result.HasErrors());
    CHECK(result.HasWarnings());
    CHECK_THAT(result.config.time.fixedDeltaTime, WithinAbs(bonk::core::Time::kDefaultFixedDeltaTime, 1e-7));
    CHECK(result.config.time.timeScale == 0.0f);
    CHECK(result.config.time.maxFixedStepsPerFrame == 64);
    CHECK(result.config.time.fixedStepMode == bonk::FixedStepMode::PerFrame);
}

TEST_CASE("ConfigLoader caps very large fixed steps", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({ "time": { "fixedDeltaTime": 5 } })");

    CHECK(result.HasErrors());
    CHECK(result.config.time.fixedDeltaTime == 1.0f);
}

TEST_CASE("ConfigLoader validates physics values", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "physics": { "backend": "", "pixelsPerUnit": -4, "maxBodies": 0, "gravity": [1, 2, 3] }
    })");

    CHECK(result.errors.size() == 3);
    CHECK(result.warnings.size() == 1);
    CHECK(result.config.physics.backend == "jolt");
    CHECK(result.config.physics.pixelsPerUnit == 100.0f);
    CHECK(result.config.physics.maxBodies == 4096u);
    CHECK(result.config.physics.gravity == bonk::Vector2(0.0f, 980.0f));
}

TEST_CASE("ConfigLoader cleans up collision layer names", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "physics": { "collisionLayers": ["player", "", "default", "player", "enemy"] }
    })");

    CHECK_FALSE(result.HasErrors());
    CHECK(result.warnings.size() == 1);
    CHECK(result.config.physics.collisionLayers == std::vector<std::string>{"player", "enemy"});
}

TEST_CASE("ConfigLoader truncates layers beyond the category bits", "[config]") {
    std::string layers;
    for (int i = 0; i < 40; ++i) {
        layers += (i == 0 ? "" : ",") + std::string("\"layer") + std::to_string(i) + "\"";
    }
    const auto result = ConfigLoader::LoadFromString("{ \"physics\": { \"collisionLayers\": [" + layers + "] } }");

    CHECK(result.HasErrors());
    CHECK(result.config.physics.collisionLayers.size() == 31);
    CHECK(result.config.physics.collisionLayers.back() == "layer30");
}

TEST_CASE("ConfigLoader warns about wrongly typed values", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({ "time": { "timeScale": "fast" }, "logging": 3 })");

    CHECK_FALSE(result.HasErrors());
    CHECK(result.warnings.size() == 2);
    CHECK(result.config.time.timeScale == 1.0f);
}

TEST_CASE("ConfigLoader falls back to defaults for a missing file", "[config]") {
    const auto result = ConfigLoader::Load("/nonexistent/bonk/config.json");

    CHECK_FALSE(result.loadedFromFile);
    CHECK_FALSE(result.HasErrors());
    CHECK(result.config.physics.backend == "jolt");
}

TEST_CASE("ConfigLoader loads from disk relative to the file", "[config]") {
    TempConfigFile file(R"({ "time": { "fixedStepMode": "accumulated" }, "logging": { "file": "run.log" } })");

    const auto result = ConfigLoader::Load(file.path);

    REQUIRE(result.loadedFromFile);
    CHECK(result.config.time.fixedStepMode == bonk::FixedStepMode::Accumulated);
    CHECK(result.config.configDirectory == file.path.parent_path());
    CHECK(result.config.logging.file == (file.path.parent_path() / "run.log").lexically_normal());
}

TEST_CASE("ConfigLoader parses fixed step modes", "[config]") {
    bool ok = false;
    CHECK(ConfigLoader::ParseFixedStepMode("accumulated", &ok) == bonk::FixedStepMode::Accumulated);
    CHECK(ok);
    CHECK(ConfigLoader::ParseFixedStepMode("perFrame", &ok) == bonk::FixedStepMode::PerFrame);
    CHECK(ok);
    CHECK(ConfigLoader::ParseFixedStepMode("Accumulated", &ok) == bonk::FixedStepMode::PerFrame);
    CHECK_FALSE(ok);
    CHECK(std::string(ConfigLoader::ToString(bonk::FixedStepMode::Accumulated)) == "accumulated");
}
