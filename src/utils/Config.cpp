#include "bonk/utils/Config.hpp"

#include "bonk/core/Logger.hpp"
#include "bonk/physics/CollisionLayers.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bonk::utils {

namespace {

constexpr float kMaxFixedDeltaTime = 1.0f;
constexpr int kMinFixedStepsPerFrame = 1;
constexpr int kMaxFixedStepsPerFrame = 64;
// One slot belongs to the default layer.
constexpr std::size_t kMaxNamedLayers = physics::CollisionLayerRegistry::kMaxLayers - 1;

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback, ConfigLoadResult& result) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        result.warnings.push_back(fmt::format("Failed to parse key '{}', using default: {}", key, e.what()));
        return fallback;
    }
}

nlohmann::json Section(const nlohmann::json& json, const char* name, ConfigLoadResult& result) {
    auto it = json.find(name);
    if (it == json.end()) {
        return nlohmann::json::object();
    }
    if (!it->is_object()) {
        result.warnings.push_back(fmt::format("Section '{}' is not an object, using defaults", name));
        return nlohmann::json::object();
    }
    return *it;
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative() && !baseDir.empty()) {
        return (baseDir / raw).lexically_normal();
    }
    return raw.lexically_normal();
}

} // namespace

SceneSettings EngineConfig::ToSceneSettings() const {
    SceneSettings settings;
    settings.gravity = physics.gravity;
    settings.pixelsPerUnit = physics.pixelsPerUnit;
    settings.physicsBackend = physics.backend;
    settings.maxBodies = physics.maxBodies;
    settings.collisionLayers = physics.collisionLayers;
    settings.fixedDeltaTime = time.fixedDeltaTime;
    settings.timeScale = time.timeScale;
    settings.fixedStepMode = time.fixedStepMode;
    settings.maxFixedStepsPerFrame = time.maxFixedStepsPerFrame;
    return settings;
}

void EngineConfig::ApplyLogging() const {
    core::Logger::SetDebugEnabled(logging.debug);
    core::Logger::SetLogFile(logging.file);
}

FixedStepMode ConfigLoader::ParseFixedStepMode(const std::string& value, bool* ok) {
    if (ok) {
        *ok = true;
    }
    if (value == "perFrame") {
        return FixedStepMode::PerFrame;
    }
    if (value == "accumulated") {
        return FixedStepMode::Accumulated;
    }
    if (ok) {
        *ok = false;
    }
    return FixedStepMode::PerFrame;
}

const char* ConfigLoader::ToString(FixedStepMode mode) {
    switch (mode) {
        case FixedStepMode::PerFrame:    return "perFrame";
        case FixedStepMode::Accumulated: return "accumulated";
    }
    return "unknown";
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                              path.empty() ? "<none>" : path.string());
        ConfigLoadResult result;
        result.config.configDirectory = baseDir;
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        ConfigLoadResult result;
        result.config.configDirectory = baseDir;
        result.errors.push_back(fmt::format("Failed to open config file '{}'", path.string()));
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    ConfigLoadResult result = LoadFromString(buffer.str(), baseDir);
    if (result.loadedFromFile) {
        core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    }
    return result;
}

ConfigLoadResult ConfigLoader::LoadFromString(const std::string& text, const std::filesystem::path& baseDir) {
    ConfigLoadResult result;
    result.config.configDirectory = baseDir;

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        core::Logger::Error("[ConfigLoader] Failed to parse JSON: {}", e.what());
        result.errors.push_back(fmt::format("Failed to parse JSON: {}", e.what()));
        return result;
    }
    if (!json.is_object()) {
        core::Logger::Error("[ConfigLoader] Config root must be a JSON object");
        result.errors.push_back("Config root must be a JSON object");
        return result;
    }

    EngineConfig& config = result.config;

    const auto timeObj = Section(json, "time", result);
    config.time.fixedDeltaTime = GetOrDefault<float>(timeObj, "fixedDeltaTime", config.time.fixedDeltaTime, result);
    config.time.timeScale = GetOrDefault<float>(timeObj, "timeScale", config.time.timeScale, result);
    config.time.maxFixedStepsPerFrame =
        GetOrDefault<int>(timeObj, "maxFixedStepsPerFrame", config.time.maxFixedStepsPerFrame, result);
    const std::string mode =
        GetOrDefault<std::string>(timeObj, "fixedStepMode", ToString(config.time.fixedStepMode), result);
    bool modeOk = true;
    config.time.fixedStepMode = ParseFixedStepMode(mode, &modeOk);
    if (!modeOk) {
        result.warnings.push_back(
            fmt::format("Unknown time.fixedStepMode '{}', expected 'perFrame' or 'accumulated'", mode));
    }

    const auto physicsObj = Section(json, "physics", result);
    config.physics.backend = GetOrDefault<std::string>(physicsObj, "backend", config.physics.backend, result);
    config.physics.pixelsPerUnit =
        GetOrDefault<float>(physicsObj, "pixelsPerUnit", config.physics.pixelsPerUnit, result);
    const auto maxBodies =
        GetOrDefault<std::int64_t>(physicsObj, "maxBodies", static_cast<std::int64_t>(config.physics.maxBodies), result);
    if (maxBodies <= 0 || maxBodies > static_cast<std::int64_t>(UINT32_MAX)) {
        result.errors.push_back(fmt::format("physics.maxBodies ({}) must be a positive 32-bit value", maxBodies));
    } else {
        config.physics.maxBodies = static_cast<std::uint32_t>(maxBodies);
    }
    const auto gravity = GetOrDefault<std::vector<float>>(physicsObj, "gravity", {}, result);
    if (!gravity.empty()) {
        if (gravity.size() == 2) {
            config.physics.gravity = Vector2(gravity[0], gravity[1]);
        } else {
            result.warnings.push_back(
                fmt::format("physics.gravity must have 2 components, got {}; using default", gravity.size()));
        }
    }
    config.physics.collisionLayers =
        GetOrDefault<std::vector<std::string>>(physicsObj, "collisionLayers", config.physics.collisionLayers, result);

    const auto loggingObj = Section(json, "logging", result);
    config.logging.debug = GetOrDefault<bool>(loggingObj, "debug", config.logging.debug, result);
    const auto logFile = GetOrDefault<std::string>(loggingObj, "file", std::string(), result);
    if (!logFile.empty()) {
        config.logging.file = ResolvePath(baseDir, logFile);
    }

    result.loadedFromFile = true;

    ValidateConfig(config, result);
    Report(result);
    return result;
}

void ConfigLoader::ValidateConfig(EngineConfig& config, ConfigLoadResult& result) {
    ValidateTimeConfig(config.time, result);
    ValidatePhysicsConfig(config.physics, result);
}

void ConfigLoader::ValidateTimeConfig(TimeConfig& time, ConfigLoadResult& result) {
    if (!(time.fixedDeltaTime > 0.0f)) {
        result.errors.push_back(
            fmt::format("time.fixedDeltaTime ({}) must be greater than 0", time.fixedDeltaTime));
        time.fixedDeltaTime = core::Time::kDefaultFixedDeltaTime;
    } else if (time.fixedDeltaTime > kMaxFixedDeltaTime) {
        result.errors.push_back(
            fmt::format("time.fixedDeltaTime ({}) must not exceed {}", time.fixedDeltaTime, kMaxFixedDeltaTime));
        time.fixedDeltaTime = kMaxFixedDeltaTime;
    }

    if (!(time.timeScale >= 0.0f)) {
        result.warnings.push_back(fmt::format("time.timeScale ({}) is negative, clamping to 0", time.timeScale));
        time.timeScale = 0.0f;
    }

    if (time.maxFixedStepsPerFrame < kMinFixedStepsPerFrame || time.maxFixedStepsPerFrame > kMaxFixedStepsPerFrame) {
        result.warnings.push_back(
            fmt::format("time.maxFixedStepsPerFrame ({}) should be between {} and {}, clamping",
                        time.maxFixedStepsPerFrame, kMinFixedStepsPerFrame, kMaxFixedStepsPerFrame));
        time.maxFixedStepsPerFrame =
            std::clamp(time.maxFixedStepsPerFrame, kMinFixedStepsPerFrame, kMaxFixedStepsPerFrame);
    }
}

void ConfigLoader::ValidatePhysicsConfig(PhysicsConfig& physics, ConfigLoadResult& result) {
    if (physics.backend.empty()) {
        result.errors.push_back("physics.backend must not be empty, using 'jolt'");
        physics.backend = "jolt";
    }

    if (!(physics.pixelsPerUnit > 0.0f)) {
        result.errors.push_back(
            fmt::format("physics.pixelsPerUnit ({}) must be greater than 0", physics.pixelsPerUnit));
        physics.pixelsPerUnit = PhysicsConfig{}.pixelsPerUnit;
    }

    std::vector<std::string> layers;
    std::unordered_set<std::string> seen{physics::CollisionLayerRegistry::kDefaultLayer};
    for (const auto& layer : physics.collisionLayers) {
        if (layer.empty()) {
            result.warnings.push_back("physics.collisionLayers contains an empty name, skipping it");
            continue;
        }
        if (!seen.insert(layer).second) {
            continue;
        }
        layers.push_back(layer);
    }
    if (layers.size() > kMaxNamedLayers) {
        result.errors.push_back(
            fmt::format("physics.collisionLayers has {} names, at most {} fit next to the default layer",
                        layers.size(), kMaxNamedLayers));
        layers.resize(kMaxNamedLayers);
    }
    physics.collisionLayers = std::move(layers);
}

void ConfigLoader::Report(const ConfigLoadResult& result) {
    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        core::Logger::Error("[ConfigLoader] {}", error);
    }
}

} // namespace bonk::utils
