#pragma once

#include "bonk/core/InputProvider.hpp"
#include "bonk/core/Time.hpp"
#include "bonk/physics/PhysicsWorld.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/SceneSettings.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bonk {

/**
 * @brief Owns a tree of GameObjects and drives their lifecycle.
 *
 * The Scene owns its clock and its physics world, routes collision events
 * from the world to the behaviors of both entities, and defers destruction
 * to the end of the frame.
 *
 * A host calls RunFrame(dt) once per rendered frame, or drives the phases
 * itself in the order: Time().Update, FixedUpdate, Update, LateUpdate,
 * ProcessPendingDestroy.
 */
class Scene {
public:
    // Throws UnknownPhysicsBackendError when settings.physicsBackend is not registered.
    explicit Scene(std::string name = "Untitled Scene",
                   SceneSettings settings = {},
                   const physics::PhysicsBackendRegistry& backends = physics::PhysicsBackendRegistry::Default());
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    const std::string& GetName() const { return m_name; }
    const SceneSettings& GetSettings() const { return m_settings; }

    core::Time& GetTime() { return m_time; }
    const core::Time& GetTime() const { return m_time; }

    physics::PhysicsWorld& GetPhysicsWorld() { return *m_world; }
    const physics::PhysicsWorld& GetPhysicsWorld() const { return *m_world; }
    std::weak_ptr<physics::PhysicsWorld> GetPhysicsWorldHandle() const { return m_world; }

    void SetInputProvider(std::shared_ptr<core::InputProvider> provider) { m_input = std::move(provider); }
    core::InputProvider* GetInputProvider() const { return m_input.get(); }

    // Membership
    std::shared_ptr<GameObject> CreateGameObject(const std::string& name);
    void Add(const std::shared_ptr<GameObject>& gameObject);
    // Detaches a live subtree without destroying it.
    void Remove(GameObject& gameObject);
    // Requests destruction at the end of the frame.
    void Destroy(GameObject& gameObject);
    void ProcessPendingDestroy();
    bool IsPendingDestroy(const GameObject& gameObject) const;

    // Queries
    std::shared_ptr<GameObject> FindById(GameObjectId id) const;
    std::shared_ptr<GameObject> FindByName(const std::string& name) const;
    std::vector<std::shared_ptr<GameObject>> FindByTag(const std::string& tag) const;
    std::shared_ptr<GameObject> FindByBody(physics::BodyId bodyId) const;
    const std::vector<std::shared_ptr<GameObject>>& GetRootGameObjects() const { return m_roots; }
    std::size_t GetGameObjectCount() const { return m_objectsById.size(); }

    // Phases
    void Awake();
    void Start();
    void FixedUpdate();
    void Update();
    void LateUpdate();
    void RunFrame(float unscaledDeltaTime);

    bool IsAwake() const { return m_awake; }
    bool IsStarted() const { return m_started; }

    // Destroys every entity and empties the physics world. The scene can be repopulated.
    void Unload();

    // Body bookkeeping used by the physics components.
    void RegisterPhysicsBody(physics::BodyId bodyId, GameObject& gameObject);
    void UnregisterPhysicsBody(physics::BodyId bodyId);

private:
    friend class GameObject;

    // Called by GameObject::SetParent after the parent edge changed.
    void HandleReparent(GameObject& gameObject);
    // Joins a subtree to this scene's lookups. Awoken objects are told through OnAddedToScene.
    void RegisterSubtree(GameObject& gameObject);
    void UnregisterSubtree(GameObject& gameObject, bool notifyComponents);
    void BringUpToDate(GameObject& gameObject);
    void DetachFromTree(GameObject& gameObject);
    void ForgetBodiesOf(const GameObject& gameObject);
    bool IsLive(const GameObject& gameObject) const;

    void SyncKinematicBodies();
    void SyncDynamicBodies();
    void RouteCollision(const physics::CollisionEvent& event, bool entered);
    GameObject* ResolveBody(const physics::PhysicsBody* body) const;

    std::string m_name;
    SceneSettings m_settings;
    core::Time m_time;
    std::shared_ptr<physics::PhysicsWorld> m_world;
    physics::CallbackId m_collisionStartCallback = 0;
    physics::CallbackId m_collisionEndCallback = 0;
    std::shared_ptr<core::InputProvider> m_input;

    std::vector<std::shared_ptr<GameObject>> m_roots;
    std::unordered_map<GameObjectId, GameObject*> m_objectsById;
    // Ordered so body sync runs in creation order.
    std::map<physics::BodyId, GameObject*> m_bodyToObject;

    std::vector<std::shared_ptr<GameObject>> m_pendingDestroy;
    std::unordered_set<GameObjectId> m_pendingDestroyIds;

    float m_fixedAccumulator = 0.0f;
    bool m_unloading = false;
    bool m_awake = false;
    bool m_started = false;
};

} // namespace bonk
