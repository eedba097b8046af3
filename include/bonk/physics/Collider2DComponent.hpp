#pragma once

#include "bonk/physics/PhysicsWorld.hpp"
#include "bonk/scene/Component.hpp"

#include <memory>

namespace bonk::physics {

/**
 * @brief Collision shape of a GameObject.
 *
 * Attaches to the RigidBody2DComponent of the same object. Without one the
 * first collider creates an implicit static body that the object's other
 * colliders share. A body holds one shape; with several colliders on one
 * object the last one applied wins.
 */
class Collider2DComponent : public Component {
public:
    explicit Collider2DComponent(ColliderConfig config = {});
    ~Collider2DComponent() override;

    ComponentKind GetKind() const override { return ComponentKind::Collider2D; }

    void Awake() override;
    void OnDestroy() override;
    void OnAddedToScene(Scene& scene) override;
    void OnRemovedFromScene(Scene& scene) override;

    const ColliderConfig& GetConfig() const { return m_config; }
    // Re-applies the shape immediately when the owner is live.
    void SetConfig(const ColliderConfig& config);

    bool IsTrigger() const { return m_config.isTrigger; }
    bool HasImplicitBody() const { return m_implicitBodyId != kInvalidBodyId; }
    // Body the shape currently sits on, kInvalidBodyId when not applied.
    BodyId GetBodyId() const { return m_appliedBodyId; }

    void Apply();

private:
    PhysicsBody* FindImplicitBody(PhysicsWorld& world) const;
    void Release();
    void ReleaseImplicitBody();

    ColliderConfig m_config;
    std::weak_ptr<PhysicsWorld> m_world;
    BodyId m_implicitBodyId = kInvalidBodyId;
    BodyId m_appliedBodyId = kInvalidBodyId;
    bool m_dirty = true;
};

} // namespace bonk::physics
