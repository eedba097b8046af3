#include "DemoBehaviors.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/Collider2DComponent.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"
#include "bonk/scene/Scene.hpp"
#include "bonk/utils/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#ifndef BONK_CONFIG_PATH
#define BONK_CONFIG_PATH "bonk.config.json"
#endif

namespace {

constexpr int kDefaultFrameCount = 240;
constexpr float kFrameDelta = 1.0f / 60.0f;

void BuildDemoScene(bonk::Scene& scene) {
    using namespace bonk;

    auto ground = scene.CreateGameObject("Ground");
    ground->SetTag("ground");
    ground->GetTransform().SetLocalPosition(400.0f, 560.0f);
    physics::ColliderConfig groundShape;
    groundShape.width = 800.0f;
    groundShape.height = 40.0f;
    groundShape.layer = "world";
    ground->AddComponent<physics::Collider2DComponent>(groundShape);

    auto zone = scene.CreateGameObject("DropZone");
    zone->GetTransform().SetLocalPosition(400.0f, 300.0f);
    physics::ColliderConfig zoneShape;
    zoneShape.width = 200.0f;
    zoneShape.height = 20.0f;
    zoneShape.isTrigger = true;
    zone->AddComponent<physics::Collider2DComponent>(zoneShape);

    auto crate = scene.CreateGameObject("Crate");
    crate->GetTransform().SetLocalPosition(400.0f, 100.0f);
    crate->GetTransform().SetLocalRotation(10.0f);
    physics::RigidBodyConfig crateBody;
    crateBody.restitution = 0.2f;
    crate->AddComponent<physics::RigidBody2DComponent>(crateBody);
    physics::ColliderConfig crateShape;
    crateShape.layer = "props";
    crate->AddComponent<physics::Collider2DComponent>(crateShape);
    crate->AddBehavior<demo::CrateHopper>();
    crate->AddBehavior<demo::PositionReporter>(0.5f);

    auto spark = GameObject::Create("Spark");
    spark->AddBehavior<demo::Fuse>(1.5f);
    crate->AddChild(spark);
}

} // namespace

int main(int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1])
                                                      : std::filesystem::path(BONK_CONFIG_PATH);
    int frames = kDefaultFrameCount;
    if (argc > 2) {
        frames = std::atoi(argv[2]);
        if (frames <= 0) {
            bonk::core::Logger::Error("[BonkHeadless] Frame count '{}' is not a positive number", argv[2]);
            return EXIT_FAILURE;
        }
    }

    auto configResult = bonk::utils::ConfigLoader::Load(configPath);
    configResult.config.ApplyLogging();
    if (configResult.HasErrors()) {
        bonk::core::Logger::Warning("[BonkHeadless] Continuing with {} corrected config value(s)",
                                    configResult.errors.size());
    }

    try {
        bonk::Scene scene("Headless Demo", configResult.config.ToSceneSettings());
        BuildDemoScene(scene);
        scene.Start();

        for (int frame = 0; frame < frames; ++frame) {
            scene.RunFrame(kFrameDelta);
        }

        bonk::core::Logger::Info("[BonkHeadless] Ran {} frames ({:.2f}s simulated), {} objects, {} bodies",
                                 frames, scene.GetTime().TotalTime(), scene.GetGameObjectCount(),
                                 scene.GetPhysicsWorld().GetBodyCount());
    } catch (const bonk::core::Error& ex) {
        bonk::core::Logger::Error("[BonkHeadless] {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
