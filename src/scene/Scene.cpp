#include "bonk/scene/Scene.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"

#include <cmath>
#include <utility>

namespace bonk {

namespace {
constexpr int kMaxFixedStepsCeiling = 64;

SceneSettings SanitizeSettings(SceneSettings settings) {
    if (settings.maxFixedStepsPerFrame < 1 || settings.maxFixedStepsPerFrame > kMaxFixedStepsCeiling) {
        const int clamped = settings.maxFixedStepsPerFrame < 1 ? 1 : kMaxFixedStepsCeiling;
        core::Logger::Warning("[Scene] maxFixedStepsPerFrame {} is out of range, using {}",
                              settings.maxFixedStepsPerFrame, clamped);
        settings.maxFixedStepsPerFrame = clamped;
    }
    return settings;
}
} // namespace

Scene::Scene(std::string name, SceneSettings settings, const physics::PhysicsBackendRegistry& backends)
    : m_name(std::move(name))
    , m_settings(SanitizeSettings(std::move(settings)))
    , m_time(m_settings.fixedDeltaTime, m_settings.timeScale) {
    physics::PhysicsWorldConfig worldConfig;
    worldConfig.gravity = m_settings.gravity;
    worldConfig.pixelsPerUnit = m_settings.pixelsPerUnit;
    worldConfig.maxBodies = m_settings.maxBodies;

    // Unknown backends propagate to the caller.
    m_world = std::shared_ptr<physics::PhysicsWorld>(backends.Create(m_settings.physicsBackend, worldConfig));

    for (const auto& layer : m_settings.collisionLayers) {
        m_world->GetCollisionLayers().Register(layer);
    }

    m_collisionStartCallback = m_world->OnCollisionStart(
        [this](const physics::CollisionEvent& event) { RouteCollision(event, true); });
    m_collisionEndCallback = m_world->OnCollisionEnd(
        [this](const physics::CollisionEvent& event) { RouteCollision(event, false); });

    core::Logger::Info("[Scene] Created '{}' (physics backend '{}')", m_name, m_world->GetBackendName());
}

Scene::~Scene() {
    Unload();
    if (m_world) {
        m_world->RemoveCollisionCallback(m_collisionStartCallback);
        m_world->RemoveCollisionCallback(m_collisionEndCallback);
    }
}

void Scene::Awake() {
    m_awake = true;
    const auto roots = m_roots;
    for (const auto& root : roots) {
        if (root->m_scene == this) {
            root->Awake();
        }
    }
}

void Scene::Start() {
    if (!m_awake) {
        Awake();
    }
    if (m_started) {
        return;
    }
    m_started = true;
    const auto roots = m_roots;
    for (const auto& root : roots) {
        if (root->m_scene == this) {
            root->Start();
        }
    }
    core::Logger::Debug("[Scene] Started '{}' with {} objects", m_name, m_objectsById.size());
}

void Scene::FixedUpdate() {
    const float fixedDeltaTime = m_time.FixedDeltaTime();

    SyncKinematicBodies();
    m_world->Step(fixedDeltaTime);
    SyncDynamicBodies();

    const auto roots = m_roots;
    for (const auto& root : roots) {
        if (root->m_scene == this) {
            root->FixedUpdate(fixedDeltaTime);
        }
    }
}

void Scene::Update() {
    const float deltaTime = m_time.DeltaTime();
    const auto roots = m_roots;
    for (const auto& root : roots) {
        if (root->m_scene == this) {
            root->Update(deltaTime);
        }
    }
}

void Scene::LateUpdate() {
    const float deltaTime = m_time.DeltaTime();
    const auto roots = m_roots;
    for (const auto& root : roots) {
        if (root->m_scene == this) {
            root->LateUpdate(deltaTime);
        }
    }
}

void Scene::RunFrame(float unscaledDeltaTime) {
    if (!m_started) {
        Start();
    }

    m_time.Update(unscaledDeltaTime);

    if (m_settings.fixedStepMode == FixedStepMode::PerFrame) {
        FixedUpdate();
    } else {
        const float fixedDeltaTime = m_time.FixedDeltaTime();
        m_fixedAccumulator += m_time.DeltaTime();
        int steps = 0;
        while (m_fixedAccumulator >= fixedDeltaTime && steps < m_settings.maxFixedStepsPerFrame) {
            FixedUpdate();
            m_fixedAccumulator -= fixedDeltaTime;
            ++steps;
        }
        if (m_fixedAccumulator >= fixedDeltaTime) {
            core::Logger::Debug("[Scene] '{}' fell behind, dropping {:.4f}s of simulation time",
                                m_name, m_fixedAccumulator - std::fmod(m_fixedAccumulator, fixedDeltaTime));
            m_fixedAccumulator = std::fmod(m_fixedAccumulator, fixedDeltaTime);
        }
    }

    Update();
    LateUpdate();
    ProcessPendingDestroy();
}

void Scene::Unload() {
    if (m_unloading) {
        return;
    }
    m_unloading = true;

    std::vector<std::shared_ptr<GameObject>> roots;
    roots.swap(m_roots);
    m_objectsById.clear();
    m_pendingDestroy.clear();
    m_pendingDestroyIds.clear();

    for (const auto& root : roots) {
        root->DestroyHierarchy();
    }
    for (const auto& root : roots) {
        UnregisterSubtree(*root, false);
    }

    m_bodyToObject.clear();
    if (m_world) {
        m_world->Clear();
    }

    m_fixedAccumulator = 0.0f;
    m_awake = false;
    m_started = false;
    m_unloading = false;

    if (!roots.empty()) {
        core::Logger::Info("[Scene] Unloaded '{}' ({} root objects)", m_name, roots.size());
    }
}

void Scene::RegisterPhysicsBody(physics::BodyId bodyId, GameObject& gameObject) {
    if (bodyId == physics::kInvalidBodyId) {
        return;
    }
    m_bodyToObject[bodyId] = &gameObject;
}

void Scene::UnregisterPhysicsBody(physics::BodyId bodyId) {
    m_bodyToObject.erase(bodyId);
}

void Scene::ForgetBodiesOf(const GameObject& gameObject) {
    for (auto it = m_bodyToObject.begin(); it != m_bodyToObject.end();) {
        if (it->second == &gameObject) {
            it = m_bodyToObject.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<GameObject> Scene::FindByBody(physics::BodyId bodyId) const {
    auto it = m_bodyToObject.find(bodyId);
    if (it == m_bodyToObject.end() || !it->second || it->second->m_destroyed) {
        return nullptr;
    }
    return it->second->weak_from_this().lock();
}

void Scene::SyncKinematicBodies() {
    // Snapshot: a misbehaving component may re-register bodies while syncing.
    std::vector<GameObject*> owners;
    owners.reserve(m_bodyToObject.size());
    for (const auto& entry : m_bodyToObject) {
        owners.push_back(entry.second);
    }
    for (GameObject* owner : owners) {
        if (!owner || owner->m_destroyed) {
            continue;
        }
        auto rigidBody = owner->GetComponent<physics::RigidBody2DComponent>();
        if (rigidBody && rigidBody->GetBodyType() == physics::BodyType::Kinematic) {
            rigidBody->SyncToPhysics();
        }
    }
}

void Scene::SyncDynamicBodies() {
    std::vector<GameObject*> owners;
    owners.reserve(m_bodyToObject.size());
    for (const auto& entry : m_bodyToObject) {
        owners.push_back(entry.second);
    }
    for (GameObject* owner : owners) {
        if (!owner || owner->m_destroyed) {
            continue;
        }
        auto rigidBody = owner->GetComponent<physics::RigidBody2DComponent>();
        if (rigidBody && rigidBody->GetBodyType() == physics::BodyType::Dynamic) {
            rigidBody->SyncFromPhysics();
        }
    }
}

GameObject* Scene::ResolveBody(const physics::PhysicsBody* body) const {
    if (!body) {
        return nullptr;
    }
    auto it = m_bodyToObject.find(body->GetId());
    if (it == m_bodyToObject.end() || !it->second || it->second->m_destroyed) {
        // Legitimate while a body is being torn down; never fatal.
        const core::CollisionRoutingError error(body->GetId());
        core::Logger::Debug("[Scene] Dropping collision event: {}", error.what());
        return nullptr;
    }
    return it->second;
}

void Scene::RouteCollision(const physics::CollisionEvent& event, bool entered) {
    GameObject* objectA = ResolveBody(event.bodyA);
    GameObject* objectB = ResolveBody(event.bodyB);
    if (!objectA || !objectB) {
        return;
    }

    // Hooks may detach either object from the scene.
    std::shared_ptr<GameObject> keepA = objectA->weak_from_this().lock();
    std::shared_ptr<GameObject> keepB = objectB->weak_from_this().lock();

    ContactInfo contact;
    if (!event.contacts.empty()) {
        contact = event.contacts.front();
    }
    ContactInfo flipped = contact;
    flipped.normal = -contact.normal;

    objectA->DispatchCollision(*objectB, contact, event.isSensor, entered);
    objectB->DispatchCollision(*objectA, flipped, event.isSensor, entered);
}

} // namespace bonk
