#pragma once
#include <string>

namespace bonk {

class GameObject;
class Scene;

enum class ComponentKind {
    RigidBody2D,
    Collider2D,
    Custom
};

const char* ToString(ComponentKind kind);

/**
 * @brief Data attached to a GameObject.
 *
 * Components hold state for engine systems (physics, rendering) and have
 * no per-frame script logic of their own; that lives in Behavior. The hooks
 * below exist for components that need to talk to a Scene-owned service.
 */
class Component {
protected:
    GameObject* owner = nullptr;
    bool enabled = true;

public:
    virtual ~Component() = default;

    virtual ComponentKind GetKind() const { return ComponentKind::Custom; }
    // Name used by ComponentFactory and blueprints.
    virtual std::string GetTypeName() const { return ToString(GetKind()); }

    // Called once when the owner becomes part of a live Scene.
    virtual void Awake() {}
    virtual void Start() {}
    virtual void Update(float /*deltaTime*/) {}
    // Called exactly once, when the owner is destroyed or the component is removed.
    virtual void OnDestroy() {}

    // An owner that has already awoken joined or left a Scene without being destroyed.
    virtual void OnAddedToScene(Scene& /*scene*/) {}
    virtual void OnRemovedFromScene(Scene& /*scene*/) {}

    void SetOwner(GameObject* obj) { owner = obj; }
    GameObject* GetOwner() const { return owner; }

    bool IsEnabled() const { return enabled; }
    void SetEnabled(bool value) { enabled = value; }
};

} // namespace bonk
