#include "FakePhysicsWorld.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/physics/Collider2DComponent.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"
#include "bonk/scene/Behavior.hpp"
#include "bonk/scene/Scene.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <memory>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;
using bonk::physics::BodyType;
using bonk::physics::Collider2DComponent;
using bonk::physics::RigidBody2DComponent;
using bonk::physics::RigidBodyConfig;

namespace {

class DestroyCounter : public bonk::Behavior {
public:
    void Start() override { ++starts; }
    void OnDestroy() override {
        ++destroyCalls;
        if (auto next = chained.lock()) {
            Destroy(*next);
        }
    }

    int starts = 0;
    int destroyCalls = 0;
    std::weak_ptr<bonk::GameObject> chained;
};

class DestroyOnUpdate : public bonk::Behavior {
public:
    void Update() override {
        Destroy();
        Destroy();
        stillFindable = Find(GetGameObject()->GetName()) != nullptr;
    }
    bool stillFindable = false;
};

std::unique_ptr<bonk::Scene> MakeScene(bonk::SceneSettings settings = bonk::test::FakeSceneSettings(),
                                       const std::string& name = "TestScene") {
    return std::make_unique<bonk::Scene>(name, std::move(settings), bonk::test::FakeBackends());
}

bonk::test::FakePhysicsWorld& FakeWorld(bonk::Scene& scene) {
    return dynamic_cast<bonk::test::FakePhysicsWorld&>(scene.GetPhysicsWorld());
}

RigidBodyConfig BodyOfType(BodyType type) {
    RigidBodyConfig config;
    config.type = type;
    return config;
}

} // namespace

TEST_CASE("Scene creates and indexes GameObjects", "[scene]") {
    auto scene = MakeScene();
    auto a = scene->CreateGameObject("A");
    auto child = bonk::GameObject::Create("Child");
    a->AddChild(child);

    CHECK(scene->GetGameObjectCount() == 2);
    CHECK(scene->GetRootGameObjects().size() == 1);
    CHECK(scene->FindById(child->GetId()) == child);
    CHECK(child->GetScene() == scene.get());
    CHECK(scene->FindByName("Child") == child);
    CHECK(scene->FindById(9999999) == nullptr);
}

TEST_CASE("Scene rejects an unknown physics backend", "[scene][physics]") {
    bonk::SceneSettings settings;
    settings.physicsBackend = "box2d";

    CHECK_THROWS_AS(bonk::Scene("Broken", settings, bonk::test::FakeBackends()),
                    bonk::core::UnknownPhysicsBackendError);
}

TEST_CASE("Scene registers configured collision layers", "[scene][physics]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.collisionLayers = {"player", "enemy"};
    auto scene = MakeScene(settings);

    const auto& layers = scene->GetPhysicsWorld().GetCollisionLayers();
    CHECK(layers.IndexOf("default") == 0u);
    CHECK(layers.IndexOf("player") == 1u);
    CHECK(layers.IndexOf("enemy") == 2u);
}

TEST_CASE("Scene destruction is deferred to the end of the frame", "[scene][destroy]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Doomed");
    auto behavior = object->AddBehavior<DestroyOnUpdate>();
    auto counter = object->AddBehavior<DestroyCounter>();

    scene->RunFrame(0.25f);

    CHECK(behavior->stillFindable);
    CHECK(object->IsDestroyed());
    CHECK(counter->destroyCalls == 1);
    CHECK(scene->FindByName("Doomed") == nullptr);
    CHECK(scene->FindById(object->GetId()) == nullptr);
    CHECK(object->GetScene() == nullptr);
    CHECK(scene->GetGameObjectCount() == 0);
}

TEST_CASE("Scene destroys whole subtrees once", "[scene][destroy]") {
    auto scene = MakeScene();
    auto parent = scene->CreateGameObject("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);
    auto parentCounter = parent->AddBehavior<DestroyCounter>();
    auto childCounter = child->AddBehavior<DestroyCounter>();
    scene->Start();

    scene->Destroy(*child);
    scene->Destroy(*parent);
    scene->Destroy(*parent);
    CHECK(scene->IsPendingDestroy(*parent));
    CHECK(scene->FindByName("Child") == child);

    scene->ProcessPendingDestroy();

    CHECK(parentCounter->destroyCalls == 1);
    CHECK(childCounter->destroyCalls == 1);
    CHECK(scene->GetGameObjectCount() == 0);
    CHECK(scene->GetRootGameObjects().empty());
}

TEST_CASE("Scene destruction queued from OnDestroy runs in the same pass", "[scene][destroy]") {
    auto scene = MakeScene();
    auto first = scene->CreateGameObject("First");
    auto second = scene->CreateGameObject("Second");
    auto firstCounter = first->AddBehavior<DestroyCounter>();
    auto secondCounter = second->AddBehavior<DestroyCounter>();
    firstCounter->chained = second;
    scene->Start();

    scene->Destroy(*first);
    scene->ProcessPendingDestroy();

    CHECK(secondCounter->destroyCalls == 1);
    CHECK(second->IsDestroyed());
    CHECK(scene->GetGameObjectCount() == 0);
}

TEST_CASE("Scene Remove detaches without destroying", "[scene][membership]") {
    auto scene = MakeScene();
    auto object = scene->CreateGameObject("Wanderer");
    auto counter = object->AddBehavior<DestroyCounter>();
    scene->Start();

    scene->Destroy(*object);
    scene->Remove(*object);
    scene->ProcessPendingDestroy();

    CHECK_FALSE(object->IsDestroyed());
    CHECK(counter->destroyCalls == 0);
    CHECK(object->GetScene() == nullptr);
    CHECK(scene->FindByName("Wanderer") == nullptr);

    auto other = MakeScene(bonk::test::FakeSceneSettings(), "Other");
    other->Start();
    other->Add(object);

    CHECK(object->GetScene() == other.get());
    CHECK(other->FindById(object->GetId()) == object);
    CHECK(counter->starts == 1);
}

TEST_CASE("Scene refuses objects owned by another scene", "[scene][membership]") {
    auto first = MakeScene(bonk::test::FakeSceneSettings(), "First");
    auto second = MakeScene(bonk::test::FakeSceneSettings(), "Second");
    auto object = first->CreateGameObject("Owned");
    auto foreignParent = second->CreateGameObject("ForeignParent");

    second->Add(object);
    CHECK(object->GetScene() == first.get());
    CHECK(second->FindById(object->GetId()) == nullptr);

    CHECK_FALSE(object->SetParent(foreignParent));
    CHECK(object->GetParentPtr() == nullptr);
    CHECK(foreignParent->GetChildCount() == 0);
}

TEST_CASE("Scene adopts detached subtrees parented under live objects", "[scene][membership]") {
    auto scene = MakeScene();
    auto anchor = scene->CreateGameObject("Anchor");
    scene->Start();

    auto branch = bonk::GameObject::Create("Branch");
    auto leaf = bonk::GameObject::Create("Leaf");
    branch->AddChild(leaf);
    auto counter = leaf->AddBehavior<DestroyCounter>();

    anchor->AddChild(branch);

    CHECK(scene->FindByName("Leaf") == leaf);
    CHECK(leaf->GetScene() == scene.get());
    CHECK(leaf->IsStarted());
    CHECK(counter->starts == 1);
    CHECK(scene->GetRootGameObjects().size() == 1);
}

TEST_CASE("Scene promotes children detached from their parent to roots", "[scene][membership]") {
    auto scene = MakeScene();
    auto parent = scene->CreateGameObject("Parent");
    auto child = bonk::GameObject::Create("Child");
    parent->AddChild(child);

    REQUIRE(child->SetParent(nullptr));

    CHECK(scene->GetRootGameObjects().size() == 2);
    CHECK(child->GetScene() == scene.get());

    REQUIRE(child->SetParent(parent));
    CHECK(scene->GetRootGameObjects().size() == 1);
}

TEST_CASE("Scene FindByTag searches the whole tree", "[scene][queries]") {
    auto scene = MakeScene();
    auto a = scene->CreateGameObject("A");
    auto b = bonk::GameObject::Create("B");
    a->AddChild(b);
    a->SetTag("pickup");
    b->SetTag("pickup");
    scene->CreateGameObject("C")->SetTag("enemy");

    CHECK(scene->FindByTag("pickup").size() == 2);
    CHECK(scene->FindByTag("enemy").size() == 1);
    CHECK(scene->FindByTag("").empty());
    CHECK(scene->FindByTag("missing").empty());
}

TEST_CASE("Scene Unload destroys everything and can be repopulated", "[scene][unload]") {
    auto scene = MakeScene();
    auto a = scene->CreateGameObject("A");
    auto aCounter = a->AddBehavior<DestroyCounter>();
    auto b = scene->CreateGameObject("B");
    auto bCounter = b->AddBehavior<DestroyCounter>();
    // Destruction requested during Unload is ignored.
    aCounter->chained = b;
    b->AddComponent<RigidBody2DComponent>();
    scene->RunFrame(0.25f);
    REQUIRE(scene->GetPhysicsWorld().GetBodyCount() == 1);

    scene->Unload();

    CHECK(aCounter->destroyCalls == 1);
    CHECK(bCounter->destroyCalls == 1);
    CHECK(scene->GetGameObjectCount() == 0);
    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 0);
    CHECK_FALSE(scene->IsStarted());

    auto fresh = scene->CreateGameObject("Fresh");
    auto freshCounter = fresh->AddBehavior<DestroyCounter>();
    scene->RunFrame(0.25f);

    CHECK(freshCounter->starts == 1);
    CHECK(scene->FindByName("Fresh") == fresh);
    CHECK(scene->FindByName("A") == nullptr);
}

TEST_CASE("Scene runs one fixed step per frame by default", "[scene][time]") {
    auto scene = MakeScene();

    scene->RunFrame(0.5f);
    scene->RunFrame(0.001f);

    CHECK(FakeWorld(*scene).GetStepCount() == 2);
    CHECK_THAT(FakeWorld(*scene).GetSimulatedTime(),
               WithinAbs(2.0f * bonk::core::Time::kDefaultFixedDeltaTime, 1e-6));
}

TEST_CASE("Scene accumulated stepping catches up with a cap", "[scene][time]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.fixedStepMode = bonk::FixedStepMode::Accumulated;
    settings.fixedDeltaTime = 0.25f;
    settings.maxFixedStepsPerFrame = 3;
    auto scene = MakeScene(settings);
    auto& world = FakeWorld(*scene);

    scene->RunFrame(0.125f);
    CHECK(world.GetStepCount() == 0);

    scene->RunFrame(0.125f);
    CHECK(world.GetStepCount() == 1);

    scene->RunFrame(0.5f);
    CHECK(world.GetStepCount() == 3);

    // Surplus beyond the cap is dropped rather than carried over.
    scene->RunFrame(2.0f);
    CHECK(world.GetStepCount() == 6);
    scene->RunFrame(0.0f);
    CHECK(world.GetStepCount() == 6);
}

TEST_CASE("Scene accumulated stepping follows the time scale", "[scene][time]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.fixedStepMode = bonk::FixedStepMode::Accumulated;
    settings.fixedDeltaTime = 0.25f;
    settings.timeScale = 0.0f;
    auto scene = MakeScene(settings);

    scene->RunFrame(1.0f);
    CHECK(FakeWorld(*scene).GetStepCount() == 0);

    scene->GetTime().SetTimeScale(2.0f);
    scene->RunFrame(0.25f);
    CHECK(FakeWorld(*scene).GetStepCount() == 2);
}

TEST_CASE("Scene clamps the fixed step cap", "[scene][time]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.maxFixedStepsPerFrame = 0;
    auto scene = MakeScene(settings);

    CHECK(scene->GetSettings().maxFixedStepsPerFrame == 1);
}

TEST_CASE("Scene syncs dynamic bodies into transforms", "[scene][physics]") {
    auto settings = bonk::test::FakeSceneSettings();
    settings.fixedStepMode = bonk::FixedStepMode::Accumulated;
    settings.fixedDeltaTime = 0.25f;
    auto scene = MakeScene(settings);

    auto crate = scene->CreateGameObject("Crate");
    crate->GetTransform().SetLocalPosition(10.0f, 20.0f);
    auto body = crate->AddComponent<RigidBody2DComponent>(BodyOfType(BodyType::Dynamic));
    scene->Start();
    REQUIRE(body->HasBody());
    CHECK(scene->FindByBody(body->GetBodyId()) == crate);

    body->SetVelocity(bonk::Vector2(4.0f, -8.0f));
    scene->RunFrame(0.5f);

    CHECK_THAT(crate->GetTransform().GetWorldPosition().x, WithinAbs(12.0f, 1e-4));
    CHECK_THAT(crate->GetTransform().GetWorldPosition().y, WithinAbs(16.0f, 1e-4));
}

TEST_CASE("Scene pushes kinematic transforms into the world before stepping", "[scene][physics]") {
    auto scene = MakeScene();
    auto platform = scene->CreateGameObject("Platform");
    auto body = platform->AddComponent<RigidBody2DComponent>(BodyOfType(BodyType::Kinematic));
    scene->Start();

    platform->GetTransform().SetLocalPosition(64.0f, 32.0f);
    platform->GetTransform().SetLocalRotation(30.0f);
    scene->RunFrame(0.25f);

    REQUIRE(body->GetBody() != nullptr);
    CHECK_THAT(body->GetBody()->GetPosition().x, WithinAbs(64.0f, 1e-4));
    CHECK_THAT(body->GetBody()->GetPosition().y, WithinAbs(32.0f, 1e-4));
    CHECK_THAT(body->GetBody()->GetRotation(), WithinAbs(30.0f, 1e-4));
}

TEST_CASE("Collider without a rigid body gets an implicit static body", "[scene][physics]") {
    auto scene = MakeScene();
    auto wall = scene->CreateGameObject("Wall");
    auto collider = wall->AddComponent<Collider2DComponent>();
    scene->Start();

    REQUIRE(collider->HasImplicitBody());
    auto* body = FakeWorld(*scene).GetFakeBody(collider->GetBodyId());
    REQUIRE(body != nullptr);
    CHECK(body->GetType() == BodyType::Static);
    CHECK(body->GetCollider().has_value());
    CHECK(scene->FindByBody(collider->GetBodyId()) == wall);

    // A rigid body added later takes the shape over.
    auto rigidBody = wall->AddComponent<RigidBody2DComponent>();
    CHECK_FALSE(collider->HasImplicitBody());
    CHECK(collider->GetBodyId() == rigidBody->GetBodyId());
    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 1);

    // Removing it hands the shape back to a static body.
    wall->RemoveComponent(rigidBody);
    CHECK(collider->HasImplicitBody());
    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 1);
    CHECK(scene->FindByBody(collider->GetBodyId()) == wall);
}

TEST_CASE("Colliders without a rigid body share one implicit body", "[scene][physics]") {
    auto scene = MakeScene();
    auto sign = scene->CreateGameObject("Sign");
    auto post = sign->AddComponent<Collider2DComponent>();
    bonk::physics::ColliderConfig boardShape;
    boardShape.shape = bonk::physics::ColliderShape::Circle;
    boardShape.radius = 12.0f;
    auto board = sign->AddComponent<Collider2DComponent>(boardShape);
    scene->Start();

    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 1);
    REQUIRE(post->GetBodyId() != bonk::physics::kInvalidBodyId);
    CHECK(board->GetBodyId() == post->GetBodyId());
    CHECK(post->HasImplicitBody());
    CHECK_FALSE(board->HasImplicitBody());

    auto* body = FakeWorld(*scene).GetFakeBody(post->GetBodyId());
    REQUIRE(body != nullptr);
    REQUIRE(body->GetCollider().has_value());
    CHECK(body->GetCollider()->shape == bonk::physics::ColliderShape::Circle);

    // The remaining collider moves onto a fresh body when the creator leaves.
    const auto firstBody = post->GetBodyId();
    sign->RemoveComponent(post);
    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 1);
    CHECK(board->HasImplicitBody());
    CHECK(board->GetBodyId() != firstBody);
    CHECK(scene->FindByBody(board->GetBodyId()) == sign);
}

TEST_CASE("Collider config changes re-apply the shape", "[scene][physics]") {
    auto scene = MakeScene();
    auto crate = scene->CreateGameObject("Crate");
    auto rigidBody = crate->AddComponent<RigidBody2DComponent>();
    auto collider = crate->AddComponent<Collider2DComponent>();
    scene->Start();

    auto* body = FakeWorld(*scene).GetFakeBody(rigidBody->GetBodyId());
    REQUIRE(body != nullptr);
    CHECK(body->GetColliderUpdates() == 1);

    bonk::physics::ColliderConfig config;
    config.shape = bonk::physics::ColliderShape::Circle;
    config.radius = 8.0f;
    collider->SetConfig(config);

    CHECK(body->GetColliderUpdates() == 2);
    REQUIRE(body->GetCollider().has_value());
    CHECK(body->GetCollider()->shape == bonk::physics::ColliderShape::Circle);
    CHECK(rigidBody->GetBodyId() == body->GetId());
}

TEST_CASE("Destroying an object removes its bodies", "[scene][physics]") {
    auto scene = MakeScene();
    auto crate = scene->CreateGameObject("Crate");
    auto rigidBody = crate->AddComponent<RigidBody2DComponent>();
    crate->AddComponent<Collider2DComponent>();
    auto wall = bonk::GameObject::Create("Wall");
    wall->AddComponent<Collider2DComponent>();
    crate->AddChild(wall);
    scene->Start();
    REQUIRE(scene->GetPhysicsWorld().GetBodyCount() == 2);
    const auto bodyId = rigidBody->GetBodyId();

    scene->Destroy(*crate);
    scene->ProcessPendingDestroy();

    CHECK(scene->GetPhysicsWorld().GetBodyCount() == 0);
    CHECK(scene->FindByBody(bodyId) == nullptr);
    CHECK_FALSE(rigidBody->HasBody());
}

TEST_CASE("Removed objects give their bodies back and recreate them on re-entry", "[scene][physics]") {
    auto first = MakeScene(bonk::test::FakeSceneSettings(), "First");
    auto second = MakeScene(bonk::test::FakeSceneSettings(), "Second");
    auto crate = first->CreateGameObject("Crate");
    auto rigidBody = crate->AddComponent<RigidBody2DComponent>();
    auto collider = crate->AddComponent<Collider2DComponent>();
    first->Start();
    REQUIRE(first->GetPhysicsWorld().GetBodyCount() == 1);

    first->Remove(*crate);
    CHECK(first->GetPhysicsWorld().GetBodyCount() == 0);
    CHECK_FALSE(rigidBody->HasBody());

    second->Add(crate);
    REQUIRE(rigidBody->HasBody());
    CHECK(second->GetPhysicsWorld().GetBodyCount() == 1);
    CHECK(second->FindByBody(rigidBody->GetBodyId()) == crate);
    CHECK(collider->GetBodyId() == rigidBody->GetBodyId());
}
