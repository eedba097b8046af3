#pragma once

#include "bonk/physics/CollisionLayers.hpp"
#include "bonk/physics/PhysicsBody.hpp"
#include "bonk/physics/PhysicsTypes.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bonk::physics {

/**
 * @brief Backend-neutral 2D physics world.
 *
 * Everything crossing this interface is in pixels and degrees. Collision
 * callbacks fire synchronously from inside Step() on the calling thread.
 */
class PhysicsWorld {
public:
    explicit PhysicsWorld(const PhysicsWorldConfig& config);
    virtual ~PhysicsWorld() = default;

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    virtual const char* GetBackendName() const = 0;

    virtual PhysicsBody& CreateBody(const RigidBodyConfig& config) = 0;
    virtual void RemoveBody(BodyId id) = 0;
    void RemoveBody(PhysicsBody& body) { RemoveBody(body.GetId()); }
    // Replaces the body's shape. The body keeps its id and velocity.
    virtual void AddCollider(PhysicsBody& body, const ColliderConfig& collider) = 0;

    virtual PhysicsBody* GetBody(BodyId id) const = 0;
    virtual std::size_t GetBodyCount() const = 0;
    // Removes every body. Registered callbacks survive.
    virtual void Clear() = 0;

    virtual void Step(float deltaTime) = 0;

    virtual void SetGravity(const Vector2& gravity) = 0;
    virtual Vector2 GetGravity() const = 0;

    virtual std::optional<RaycastHit> Raycast(const Vector2& origin,
                                              const Vector2& direction,
                                              float maxDistance) const = 0;
    virtual std::vector<PhysicsBody*> QueryAABB(const Vector2& min, const Vector2& max) const = 0;

    CallbackId OnCollisionStart(CollisionCallback callback);
    CallbackId OnCollisionEnd(CollisionCallback callback);
    bool RemoveCollisionCallback(CallbackId id);

    CollisionLayerRegistry& GetCollisionLayers() { return m_layers; }
    const CollisionLayerRegistry& GetCollisionLayers() const { return m_layers; }

    float GetPixelsPerUnit() const { return m_pixelsPerUnit; }

protected:
    void DispatchCollisionStart(const CollisionEvent& event);
    void DispatchCollisionEnd(const CollisionEvent& event);

private:
    using CallbackList = std::vector<std::pair<CallbackId, CollisionCallback>>;

    void Dispatch(const CallbackList& callbacks, const CollisionEvent& event);

    CollisionLayerRegistry m_layers;
    float m_pixelsPerUnit = 100.0f;
    CallbackId m_nextCallbackId = 1;
    CallbackList m_startCallbacks;
    CallbackList m_endCallbacks;
};

/**
 * @brief Name -> factory table for physics backends.
 *
 * Default() comes with "jolt" registered. Tests register their own doubles
 * on a private registry instance.
 */
class PhysicsBackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<PhysicsWorld>(const PhysicsWorldConfig&)>;

    static PhysicsBackendRegistry& Default();

    // Returns false if the name is already taken.
    bool Register(const std::string& name, Factory factory);
    bool Unregister(const std::string& name);
    bool IsRegistered(const std::string& name) const;

    // Throws UnknownPhysicsBackendError for names nobody registered.
    std::unique_ptr<PhysicsWorld> Create(const std::string& name, const PhysicsWorldConfig& config) const;

    std::vector<std::string> GetBackendNames() const;

private:
    std::vector<std::pair<std::string, Factory>> m_factories;
};

} // namespace bonk::physics
