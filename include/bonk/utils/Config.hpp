#pragma once

#include "bonk/math/Vector2.hpp"
#include "bonk/scene/SceneSettings.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bonk::utils {

struct TimeConfig {
    float fixedDeltaTime = core::Time::kDefaultFixedDeltaTime;
    float timeScale = 1.0f;
    FixedStepMode fixedStepMode = FixedStepMode::PerFrame;
    int maxFixedStepsPerFrame = 5;
};

struct PhysicsConfig {
    std::string backend = "jolt";
    Vector2 gravity{0.0f, 980.0f};
    float pixelsPerUnit = 100.0f;
    std::uint32_t maxBodies = 4096;
    std::vector<std::string> collisionLayers;
};

struct LoggingConfig {
    bool debug = false;
    // Empty disables the log file.
    std::filesystem::path file;
};

struct EngineConfig {
    TimeConfig time;
    PhysicsConfig physics;
    LoggingConfig logging;
    std::filesystem::path configDirectory;

    SceneSettings ToSceneSettings() const;
    // Applies the logging section to core::Logger.
    void ApplyLogging() const;
};

struct ConfigLoadResult {
    EngineConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Invalid values; the config holds clamped or default values
    std::vector<std::string> warnings;    // Suspicious values that were adjusted

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);
    static ConfigLoadResult LoadFromString(const std::string& text,
                                           const std::filesystem::path& baseDir = std::filesystem::path());

    static FixedStepMode ParseFixedStepMode(const std::string& value, bool* ok = nullptr);
    static const char* ToString(FixedStepMode mode);

private:
    static void ValidateConfig(EngineConfig& config, ConfigLoadResult& result);
    static void ValidateTimeConfig(TimeConfig& time, ConfigLoadResult& result);
    static void ValidatePhysicsConfig(PhysicsConfig& physics, ConfigLoadResult& result);
    static void Report(const ConfigLoadResult& result);
};

} // namespace bonk::utils
