#include "bonk/physics/Collider2DComponent.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/Scene.hpp"

#include <utility>

namespace bonk::physics {

Collider2DComponent::Collider2DComponent(ColliderConfig config)
    : m_config(std::move(config)) {}

Collider2DComponent::~Collider2DComponent() {
    if (auto world = m_world.lock()) {
        if (m_implicitBodyId != kInvalidBodyId && world->GetBody(m_implicitBodyId)) {
            world->RemoveBody(m_implicitBodyId);
        }
    }
}

void Collider2DComponent::Awake() {
    Apply();
}

void Collider2DComponent::OnDestroy() {
    Release();

    // The remaining colliders of a live object take over the body's shape.
    if (owner && !owner->IsDestroyed() && owner->IsAwake()) {
        for (const auto& other : owner->GetComponents<Collider2DComponent>()) {
            if (other.get() != this) {
                other->m_dirty = true;
                other->Apply();
            }
        }
    }
}

void Collider2DComponent::OnAddedToScene(Scene& /*scene*/) {
    Apply();
}

void Collider2DComponent::OnRemovedFromScene(Scene& /*scene*/) {
    Release();
}

void Collider2DComponent::SetConfig(const ColliderConfig& config) {
    m_config = config;
    m_dirty = true;
    if (owner && owner->IsAwake() && !owner->IsDestroyed()) {
        Apply();
    }
}

void Collider2DComponent::Apply() {
    if (!owner || owner->IsDestroyed()) {
        return;
    }
    Scene* scene = owner->GetScene();
    if (!scene) {
        return;
    }
    std::shared_ptr<PhysicsWorld> world = scene->GetPhysicsWorldHandle().lock();
    if (!world) {
        return;
    }

    PhysicsBody* target = nullptr;
    if (auto rigidBody = owner->GetComponent<RigidBody2DComponent>()) {
        // The rigid body applies its colliders once its own body exists.
        if (!rigidBody->HasBody()) {
            return;
        }
        ReleaseImplicitBody();
        target = rigidBody->GetBody();
    } else {
        target = FindImplicitBody(*world);
        if (!target) {
            RigidBodyConfig config;
            config.type = BodyType::Static;
            config.position = owner->GetTransform().GetWorldPosition();
            config.rotation = owner->GetTransform().GetWorldRotation();
            try {
                target = &world->CreateBody(config);
            } catch (const core::PhysicsError& ex) {
                core::Logger::Error("[Collider2D] Could not create static body for '{}': {}",
                                    owner->GetName(), ex.what());
                return;
            }
            m_implicitBodyId = target->GetId();
            m_world = world;
            m_dirty = true;
            scene->RegisterPhysicsBody(m_implicitBodyId, *owner);
        }
    }

    if (!m_dirty && target->GetId() == m_appliedBodyId) {
        return;
    }

    try {
        world->AddCollider(*target, m_config);
    } catch (const core::PhysicsError& ex) {
        core::Logger::Error("[Collider2D] Could not attach {} collider to '{}': {}",
                            ToString(m_config.shape), owner->GetName(), ex.what());
        return;
    }
    m_world = world;
    m_appliedBodyId = target->GetId();
    m_dirty = false;
}

PhysicsBody* Collider2DComponent::FindImplicitBody(PhysicsWorld& world) const {
    if (m_implicitBodyId != kInvalidBodyId) {
        if (PhysicsBody* body = world.GetBody(m_implicitBodyId)) {
            return body;
        }
    }
    // Sibling colliders share the static body of whichever created it first.
    for (const auto& other : owner->GetComponents<Collider2DComponent>()) {
        if (other.get() != this && other->m_implicitBodyId != kInvalidBodyId) {
            if (PhysicsBody* body = world.GetBody(other->m_implicitBodyId)) {
                return body;
            }
        }
    }
    return nullptr;
}

void Collider2DComponent::Release() {
    ReleaseImplicitBody();
    m_appliedBodyId = kInvalidBodyId;
    m_dirty = true;
}

void Collider2DComponent::ReleaseImplicitBody() {
    if (m_implicitBodyId == kInvalidBodyId) {
        return;
    }
    std::shared_ptr<PhysicsWorld> world = m_world.lock();
    if (!world && owner && owner->GetScene()) {
        world = owner->GetScene()->GetPhysicsWorldHandle().lock();
    }
    if (world && world->GetBody(m_implicitBodyId)) {
        world->RemoveBody(m_implicitBodyId);
    }
    if (owner) {
        if (Scene* scene = owner->GetScene()) {
            scene->UnregisterPhysicsBody(m_implicitBodyId);
        }
    }
    if (m_appliedBodyId == m_implicitBodyId) {
        m_appliedBodyId = kInvalidBodyId;
        m_dirty = true;
    }
    m_implicitBodyId = kInvalidBodyId;
}

} // namespace bonk::physics
