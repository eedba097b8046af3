#pragma once

#include "bonk/core/EventEmitter.hpp"
#include "bonk/math/Vector2.hpp"
#include "bonk/physics/PhysicsTypes.hpp"
#include "bonk/scene/Scheduler.hpp"

#include <memory>
#include <string>
#include <vector>

namespace bonk {

class GameObject;
class Scene;
class Transform;

namespace physics {
class RigidBody2DComponent;
}

namespace scene {
class BehaviorRegistry;
}

using ContactInfo = physics::ContactPoint;

/**
 * @brief Scripted unit of per-entity logic.
 *
 * Subclasses override the hooks they need. Every hook call is isolated: an
 * exception thrown from one behavior is logged and the frame continues with
 * the next behavior. A disabled behavior receives no per-frame hooks, no
 * collision hooks and does not advance its coroutines.
 *
 * Each behavior owns a coroutine Scheduler and an EventEmitter; both are
 * emptied when the behavior is torn down, before OnDestroy runs.
 */
class Behavior {
public:
    Behavior() = default;
    virtual ~Behavior() = default;

    Behavior(const Behavior&) = delete;
    Behavior& operator=(const Behavior&) = delete;

    virtual void Awake() {}
    virtual void Start() {}
    virtual void FixedUpdate() {}
    virtual void Update() {}
    virtual void LateUpdate() {}
    virtual void OnDestroy() {}

    // The normal points away from this behavior's entity.
    virtual void OnCollisionEnter(GameObject& /*other*/, const ContactInfo& /*contact*/) {}
    virtual void OnCollisionExit(GameObject& /*other*/) {}
    virtual void OnTriggerEnter(GameObject& /*other*/) {}
    virtual void OnTriggerExit(GameObject& /*other*/) {}

    // Registered name when created through a BehaviorRegistry, otherwise the RTTI name.
    std::string GetName() const;

    GameObject* GetGameObject() const { return m_owner; }
    Transform& GetTransform() const;
    Scene* GetScene() const;

    bool IsEnabled() const { return m_enabled; }
    void SetEnabled(bool enabled) { m_enabled = enabled; }
    bool HasAwoken() const { return m_awoken; }
    bool HasStarted() const { return m_started; }
    bool IsDestroyed() const { return m_destroyed; }

    // Coroutines
    scene::CoroutineHandle StartCoroutine(scene::Coroutine coroutine);
    bool StopCoroutine(const scene::CoroutineHandle& handle);
    void StopAllCoroutines();
    std::size_t GetActiveCoroutineCount() const { return m_scheduler.GetActiveCount(); }

    // Lookups on the owning entity
    template<typename T>
    std::shared_ptr<T> GetComponent() const;

    template<typename T>
    std::shared_ptr<T> GetBehavior() const;

    std::shared_ptr<physics::RigidBody2DComponent> GetRigidBody() const;

    // Scene queries; empty when the entity is not in a scene.
    std::shared_ptr<GameObject> Find(const std::string& name) const;
    std::vector<std::shared_ptr<GameObject>> FindWithTag(const std::string& tag) const;

    // Deferred destruction through the owning scene.
    void Destroy();
    void Destroy(GameObject& target);
    scene::CoroutineHandle DestroyAfter(float seconds);
    scene::CoroutineHandle DestroyAfter(float seconds, const std::shared_ptr<GameObject>& target);

    // Time
    float DeltaTime() const;
    float FixedDeltaTime() const;
    float TimeScale() const;
    void SetTimeScale(float scale);

    // Input; neutral values when the scene has no InputProvider.
    float GetAxis(const std::string& name) const;
    float GetAxisRaw(const std::string& name) const;
    bool GetButton(const std::string& name) const;
    bool GetButtonDown(const std::string& name) const;
    bool GetButtonUp(const std::string& name) const;
    bool GetKey(const std::string& code) const;
    bool GetKeyDown(const std::string& code) const;
    bool GetKeyUp(const std::string& code) const;
    Vector2 GetMousePosition() const;
    bool GetMouseButton(int button) const;
    bool GetMouseButtonDown(int button) const;

    core::EventEmitter& Events() { return m_events; }
    const core::EventEmitter& Events() const { return m_events; }

private:
    friend class GameObject;
    friend class scene::BehaviorRegistry;

    void Attach(GameObject* owner);
    void TickCoroutines(float deltaTime);

    GameObject* m_owner = nullptr;
    std::string m_registeredName;
    bool m_enabled = true;
    bool m_awoken = false;
    bool m_started = false;
    bool m_destroyed = false;
    scene::Scheduler m_scheduler;
    core::EventEmitter m_events;
};

} // namespace bonk

// Template members of Behavior need the complete GameObject.
#include "bonk/scene/GameObject.hpp"
