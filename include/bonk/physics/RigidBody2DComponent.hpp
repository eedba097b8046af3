#pragma once

#include "bonk/physics/PhysicsWorld.hpp"
#include "bonk/scene/Component.hpp"

#include <memory>

namespace bonk::physics {

/**
 * @brief Gives a GameObject a body in its scene's PhysicsWorld.
 *
 * The body is created at the owner's world pose when the owner awakes and
 * removed when the component is destroyed. Its shape comes from the
 * Collider2DComponent on the same object; until then the body carries a
 * placeholder shape.
 *
 * Dynamic bodies write their pose back into the Transform after each step,
 * kinematic bodies read it from the Transform before each step, static
 * bodies are never synced after creation.
 */
class RigidBody2DComponent : public Component {
public:
    explicit RigidBody2DComponent(RigidBodyConfig config = {});
    ~RigidBody2DComponent() override;

    ComponentKind GetKind() const override { return ComponentKind::RigidBody2D; }

    void Awake() override;
    void OnDestroy() override;
    void OnAddedToScene(Scene& scene) override;
    void OnRemovedFromScene(Scene& scene) override;

    const RigidBodyConfig& GetConfig() const { return m_config; }
    // Only takes effect for a body that has not been created yet.
    void SetConfig(const RigidBodyConfig& config);
    BodyType GetBodyType() const { return m_config.type; }

    bool HasBody() const { return GetBody() != nullptr; }
    BodyId GetBodyId() const { return m_bodyId; }
    PhysicsBody* GetBody() const;

    void ApplyForce(const Vector2& force);
    void ApplyImpulse(const Vector2& impulse);
    void SetVelocity(const Vector2& velocity);
    Vector2 GetVelocity() const;
    void SetAngularVelocity(float degreesPerSecond);
    float GetAngularVelocity() const;
    // Moves both the body and the owner's Transform.
    void SetPosition(const Vector2& position);
    void SetRotation(float degrees);

    void SyncToPhysics();
    void SyncFromPhysics();

    void EnsureBody();

private:
    void DestroyBody();
    void ApplyColliders();

    RigidBodyConfig m_config;
    std::weak_ptr<PhysicsWorld> m_world;
    BodyId m_bodyId = kInvalidBodyId;
};

} // namespace bonk::physics
