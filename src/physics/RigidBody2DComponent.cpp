#include "bonk/physics/RigidBody2DComponent.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/Collider2DComponent.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/Scene.hpp"

#include <utility>

namespace bonk::physics {

RigidBody2DComponent::RigidBody2DComponent(RigidBodyConfig config)
    : m_config(std::move(config)) {}

RigidBody2DComponent::~RigidBody2DComponent() {
    // The owner may already be gone here; only the world is touched.
    if (auto world = m_world.lock()) {
        if (m_bodyId != kInvalidBodyId && world->GetBody(m_bodyId)) {
            world->RemoveBody(m_bodyId);
        }
    }
}

void RigidBody2DComponent::Awake() {
    EnsureBody();
    ApplyColliders();
}

void RigidBody2DComponent::OnDestroy() {
    DestroyBody();

    // Removed from a live object: its colliders fall back to an implicit static body.
    if (owner && !owner->IsDestroyed() && owner->IsAwake() && owner->GetScene()) {
        ApplyColliders();
    }
}

void RigidBody2DComponent::OnAddedToScene(Scene& /*scene*/) {
    EnsureBody();
    ApplyColliders();
}

void RigidBody2DComponent::OnRemovedFromScene(Scene& /*scene*/) {
    DestroyBody();
}

void RigidBody2DComponent::SetConfig(const RigidBodyConfig& config) {
    if (HasBody()) {
        core::Logger::Warning("[RigidBody2D] Config change on '{}' ignored: the body already exists",
                              owner ? owner->GetName() : std::string("<detached>"));
        return;
    }
    m_config = config;
}

PhysicsBody* RigidBody2DComponent::GetBody() const {
    if (m_bodyId == kInvalidBodyId) {
        return nullptr;
    }
    auto world = m_world.lock();
    return world ? world->GetBody(m_bodyId) : nullptr;
}

void RigidBody2DComponent::EnsureBody() {
    if (HasBody() || !owner) {
        return;
    }
    Scene* scene = owner->GetScene();
    if (!scene) {
        core::Logger::Debug("[RigidBody2D] '{}' is not in a scene; body creation deferred", owner->GetName());
        return;
    }
    std::shared_ptr<PhysicsWorld> world = scene->GetPhysicsWorldHandle().lock();
    if (!world) {
        return;
    }

    RigidBodyConfig config = m_config;
    config.position = owner->GetTransform().GetWorldPosition();
    config.rotation = owner->GetTransform().GetWorldRotation();

    try {
        PhysicsBody& body = world->CreateBody(config);
        m_bodyId = body.GetId();
    } catch (const core::PhysicsError& ex) {
        core::Logger::Error("[RigidBody2D] Could not create {} body for '{}': {}",
                            ToString(config.type), owner->GetName(), ex.what());
        m_bodyId = kInvalidBodyId;
        return;
    }

    m_world = world;
    scene->RegisterPhysicsBody(m_bodyId, *owner);
    core::Logger::Debug("[RigidBody2D] Created {} body {} for '{}'", ToString(config.type), m_bodyId, owner->GetName());
}

void RigidBody2DComponent::DestroyBody() {
    if (m_bodyId == kInvalidBodyId) {
        return;
    }
    if (auto world = m_world.lock()) {
        if (world->GetBody(m_bodyId)) {
            world->RemoveBody(m_bodyId);
        }
    }
    if (owner) {
        if (Scene* scene = owner->GetScene()) {
            scene->UnregisterPhysicsBody(m_bodyId);
        }
    }
    m_bodyId = kInvalidBodyId;
    m_world.reset();
}

void RigidBody2DComponent::ApplyColliders() {
    if (!owner) {
        return;
    }
    for (const auto& collider : owner->GetComponents<Collider2DComponent>()) {
        collider->Apply();
    }
}

void RigidBody2DComponent::ApplyForce(const Vector2& force) {
    if (PhysicsBody* body = GetBody()) {
        body->ApplyForce(force);
    }
}

void RigidBody2DComponent::ApplyImpulse(const Vector2& impulse) {
    if (PhysicsBody* body = GetBody()) {
        body->ApplyImpulse(impulse);
    }
}

void RigidBody2DComponent::SetVelocity(const Vector2& velocity) {
    if (PhysicsBody* body = GetBody()) {
        body->SetVelocity(velocity);
    }
}

Vector2 RigidBody2DComponent::GetVelocity() const {
    PhysicsBody* body = GetBody();
    return body ? body->GetVelocity() : Vector2(0.0f);
}

void RigidBody2DComponent::SetAngularVelocity(float degreesPerSecond) {
    if (PhysicsBody* body = GetBody()) {
        body->SetAngularVelocity(degreesPerSecond);
    }
}

float RigidBody2DComponent::GetAngularVelocity() const {
    PhysicsBody* body = GetBody();
    return body ? body->GetAngularVelocity() : 0.0f;
}

void RigidBody2DComponent::SetPosition(const Vector2& position) {
    if (PhysicsBody* body = GetBody()) {
        body->SetPosition(position);
    }
    if (owner) {
        owner->GetTransform().SetWorldPosition(position);
    }
}

void RigidBody2DComponent::SetRotation(float degrees) {
    if (PhysicsBody* body = GetBody()) {
        body->SetRotation(degrees);
    }
    if (owner) {
        owner->GetTransform().SetWorldRotation(degrees);
    }
}

void RigidBody2DComponent::SyncToPhysics() {
    PhysicsBody* body = GetBody();
    if (!body || !owner) {
        return;
    }
    const Transform& transform = owner->GetTransform();
    body->SetPosition(transform.GetWorldPosition());
    body->SetRotation(transform.GetWorldRotation());
}

void RigidBody2DComponent::SyncFromPhysics() {
    PhysicsBody* body = GetBody();
    if (!body || !owner) {
        return;
    }
    Transform& transform = owner->GetTransform();
    transform.SetWorldPosition(body->GetPosition());
    if (!m_config.fixedRotation) {
        transform.SetWorldRotation(body->GetRotation());
    }
}

} // namespace bonk::physics
