#pragma once

#include "bonk/physics/PhysicsWorld.hpp"

#include <Jolt/Jolt.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/Shape/Shape.h>
#include <Jolt/Physics/PhysicsSystem.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace bonk::physics {

class JoltPhysicsWorld;

/**
 * @brief PhysicsBody backed by a Jolt body locked to the XY plane.
 *
 * The Jolt body underneath is replaced whenever a collider is attached, so
 * nothing outside this backend should hold on to its JPH::BodyID.
 */
class JoltBody final : public PhysicsBody {
public:
    JoltBody(JoltPhysicsWorld& world, BodyId id, const RigidBodyConfig& config);

    BodyId GetId() const override { return m_id; }
    BodyType GetType() const override { return m_config.type; }

    Vector2 GetPosition() const override;
    float GetRotation() const override;
    Vector2 GetVelocity() const override;
    float GetAngularVelocity() const override;

    void ApplyForce(const Vector2& force) override;
    void ApplyImpulse(const Vector2& impulse) override;
    void SetVelocity(const Vector2& velocity) override;
    void SetAngularVelocity(float degreesPerSecond) override;
    void SetPosition(const Vector2& position) override;
    void SetRotation(float degrees) override;

    const RigidBodyConfig& GetConfig() const { return m_config; }
    const std::optional<ColliderConfig>& GetCollider() const { return m_collider; }
    JPH::BodyID GetJoltId() const { return m_joltId; }

private:
    friend class JoltPhysicsWorld;

    JoltPhysicsWorld& m_world;
    BodyId m_id = kInvalidBodyId;
    RigidBodyConfig m_config;
    std::optional<ColliderConfig> m_collider;
    JPH::BodyID m_joltId;
};

/**
 * @brief Jolt Physics backend.
 *
 * Jolt works in meters and radians; this class converts at the boundary using
 * the world's pixels-per-unit. Bodies live at z = 0 with their degrees of
 * freedom restricted to planar motion. Contacts reported from Jolt's worker
 * threads are buffered and dispatched on the caller's thread once the step
 * has finished.
 */
class JoltPhysicsWorld final : public PhysicsWorld {
public:
    static constexpr const char* kBackendName = "jolt";

    explicit JoltPhysicsWorld(const PhysicsWorldConfig& config = {});
    ~JoltPhysicsWorld() override;

    const char* GetBackendName() const override { return kBackendName; }

    PhysicsBody& CreateBody(const RigidBodyConfig& config) override;
    void RemoveBody(BodyId id) override;
    using PhysicsWorld::RemoveBody;
    void AddCollider(PhysicsBody& body, const ColliderConfig& collider) override;

    PhysicsBody* GetBody(BodyId id) const override;
    std::size_t GetBodyCount() const override { return m_bodies.size(); }
    void Clear() override;

    void Step(float deltaTime) override;

    void SetGravity(const Vector2& gravity) override;
    Vector2 GetGravity() const override;

    std::optional<RaycastHit> Raycast(const Vector2& origin,
                                      const Vector2& direction,
                                      float maxDistance) const override;
    std::vector<PhysicsBody*> QueryAABB(const Vector2& min, const Vector2& max) const override;

private:
    friend class JoltBody;

    struct ObjectLayerEntry {
        std::uint32_t category = 1;
        std::uint32_t mask = CollisionLayerRegistry::kAllLayers;
        bool moving = false;
    };

    struct PendingContact {
        JPH::BodyID first;
        JPH::BodyID second;
        // Pixels.
        Vector2 point{0.0f};
        Vector2 normal{0.0f};
        bool hasPoint = false;
        bool isSensor = false;
        bool started = true;
    };

    struct ActivePair {
        JPH::BodyID first;
        JPH::BodyID second;
        bool isSensor = false;
    };

    class BroadPhaseLayerInterfaceImpl;
    class ObjectLayerPairFilterImpl;
    class ObjectVsBroadPhaseLayerFilterImpl;
    class ContactListenerImpl;

    JPH::ObjectLayer ResolveObjectLayer(const RigidBodyConfig& config, const ColliderConfig* collider);
    JPH::ShapeRefC BuildShape(const ColliderConfig& collider) const;
    // A null collider gives the body a placeholder box.
    JPH::Body* CreateJoltBody(JoltBody& body,
                              const ColliderConfig* collider,
                              const JPH::RVec3& position,
                              const JPH::Quat& rotation);
    void DestroyJoltBody(JPH::BodyID id);
    void FlushContacts();
    JoltBody* FindByJoltId(const JPH::BodyID& id) const;

    JPH::BodyInterface& GetBodyInterface() const;
    JPH::RVec3 ToJoltPosition(const Vector2& pixels) const;
    JPH::Vec3 ToJoltVector(const Vector2& pixels) const;
    Vector2 FromJolt(JPH::Vec3Arg meters) const;
    Vector2 FromJoltPosition(const JPH::RVec3& meters) const;
    static JPH::Quat ToJoltRotation(float degrees);
    static float FromJoltRotation(const JPH::Quat& rotation);

    static std::uint64_t PairKey(const JPH::BodyID& a, const JPH::BodyID& b);

    std::unique_ptr<JPH::TempAllocatorImpl> m_tempAllocator;
    std::unique_ptr<JPH::JobSystemThreadPool> m_jobSystem;
    std::unique_ptr<BroadPhaseLayerInterfaceImpl> m_broadPhaseLayerInterface;
    std::unique_ptr<ObjectLayerPairFilterImpl> m_objectLayerPairFilter;
    std::unique_ptr<ObjectVsBroadPhaseLayerFilterImpl> m_objectVsBroadPhaseLayerFilter;
    std::unique_ptr<ContactListenerImpl> m_contactListener;
    std::unique_ptr<JPH::PhysicsSystem> m_physicsSystem;

    // Read by Jolt's filters from worker threads; only grows between steps.
    std::vector<ObjectLayerEntry> m_objectLayers;

    std::unordered_map<BodyId, std::unique_ptr<JoltBody>> m_bodies;
    std::unordered_map<JPH::uint32, BodyId> m_joltToBody;
    std::unordered_map<std::uint64_t, ActivePair> m_activePairs;
    // Bodies removed from inside a collision callback stay alive until the step ends.
    std::vector<std::unique_ptr<JoltBody>> m_retiredBodies;
    BodyId m_nextBodyId = 1;
    bool m_stepping = false;
};

} // namespace bonk::physics
