#pragma once

#include "bonk/core/Time.hpp"
#include "bonk/math/Vector2.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bonk {

enum class FixedStepMode {
    // Exactly one fixed step per frame.
    PerFrame,
    // As many fixed steps as the accumulated scaled time allows, up to a cap.
    Accumulated
};

struct SceneSettings {
    Vector2 gravity{0.0f, 980.0f};
    float pixelsPerUnit = 100.0f;
    std::string physicsBackend = "jolt";
    std::uint32_t maxBodies = 4096;
    // Registered in order, after "default".
    std::vector<std::string> collisionLayers;

    float fixedDeltaTime = core::Time::kDefaultFixedDeltaTime;
    float timeScale = 1.0f;
    FixedStepMode fixedStepMode = FixedStepMode::PerFrame;
    int maxFixedStepsPerFrame = 5;
};

} // namespace bonk
