#pragma once

#include "bonk/core/Error.hpp"
#include "bonk/scene/Behavior.hpp"
#include "bonk/scene/Component.hpp"
#include "bonk/scene/Transform.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace bonk {

class Scene;

using GameObjectId = std::uint64_t;

/**
 * @brief Node of the entity tree.
 *
 * Always owned through std::shared_ptr (use Create or std::make_shared).
 * Parents own their children; the Scene owns the roots. Lifecycle methods
 * are driven by the owning Scene and recurse into children.
 */
class GameObject : public std::enable_shared_from_this<GameObject> {
public:
    explicit GameObject(std::string name = "GameObject");
    ~GameObject();

    GameObject(const GameObject&) = delete;
    GameObject& operator=(const GameObject&) = delete;

    static std::shared_ptr<GameObject> Create(std::string name = "GameObject");

    // Unique per process, never reused.
    GameObjectId GetId() const { return m_id; }

    const std::string& GetName() const { return m_name; }
    void SetName(const std::string& name) { m_name = name; }

    // Empty string means "no tag".
    const std::string& GetTag() const { return m_tag; }
    void SetTag(const std::string& tag) { m_tag = tag; }
    bool HasTag(const std::string& tag) const { return !m_tag.empty() && m_tag == tag; }

    bool IsEnabled() const { return m_enabled; }
    void SetEnabled(bool enabled) { m_enabled = enabled; }
    // Enabled and every ancestor enabled.
    bool IsActiveInHierarchy() const;

    Transform& GetTransform() { return m_transform; }
    const Transform& GetTransform() const { return m_transform; }

    // Hierarchy
    std::shared_ptr<GameObject> GetParent() const;
    GameObject* GetParentPtr() const { return m_parent; }
    // Throws CyclicHierarchyError when parent is this object or one of its descendants.
    // Returns false when the move is rejected for any other reason.
    bool SetParent(const std::shared_ptr<GameObject>& parent);
    void AddChild(const std::shared_ptr<GameObject>& child);
    const std::vector<std::shared_ptr<GameObject>>& GetChildren() const { return m_children; }
    std::size_t GetChildCount() const { return m_children.size(); }
    std::shared_ptr<GameObject> FindChild(const std::string& name, bool recursive = false) const;
    bool IsAncestorOf(const GameObject& other) const;
    GameObject& GetRoot();

    // Components
    template<typename T, typename... Args>
    std::shared_ptr<T> AddComponent(Args&&... args) {
        static_assert(std::is_base_of_v<Component, T>, "T must inherit from Component");
        auto component = std::make_shared<T>(std::forward<Args>(args)...);
        AttachComponent(component);
        return component;
    }

    std::shared_ptr<Component> AddComponent(std::shared_ptr<Component> component) {
        if (component) {
            AttachComponent(component);
        }
        return component;
    }

    template<typename T>
    std::shared_ptr<T> GetComponent() const {
        for (const auto& component : m_components) {
            if (auto result = std::dynamic_pointer_cast<T>(component)) {
                return result;
            }
        }
        return nullptr;
    }

    template<typename T>
    std::vector<std::shared_ptr<T>> GetComponents() const {
        std::vector<std::shared_ptr<T>> results;
        for (const auto& component : m_components) {
            if (auto result = std::dynamic_pointer_cast<T>(component)) {
                results.push_back(result);
            }
        }
        return results;
    }

    template<typename T>
    bool HasComponent() const {
        return GetComponent<T>() != nullptr;
    }

    template<typename T>
    std::shared_ptr<T> RequireComponent() const {
        auto component = GetComponent<T>();
        if (!component) {
            throw core::MissingComponentError(m_name, typeid(T).name());
        }
        return component;
    }

    std::shared_ptr<Component> GetComponentByKind(ComponentKind kind) const;
    bool RemoveComponent(const std::shared_ptr<Component>& component);
    const std::vector<std::shared_ptr<Component>>& GetAllComponents() const { return m_components; }

    // Behaviors
    template<typename T, typename... Args>
    std::shared_ptr<T> AddBehavior(Args&&... args) {
        static_assert(std::is_base_of_v<Behavior, T>, "T must inherit from Behavior");
        auto behavior = std::make_shared<T>(std::forward<Args>(args)...);
        AttachBehavior(behavior);
        return behavior;
    }

    std::shared_ptr<Behavior> AddBehavior(std::shared_ptr<Behavior> behavior) {
        if (behavior) {
            AttachBehavior(behavior);
        }
        return behavior;
    }

    template<typename T>
    std::shared_ptr<T> GetBehavior() const {
        for (const auto& behavior : m_behaviors) {
            if (auto result = std::dynamic_pointer_cast<T>(behavior)) {
                return result;
            }
        }
        return nullptr;
    }

    template<typename T>
    std::vector<std::shared_ptr<T>> GetBehaviors() const {
        std::vector<std::shared_ptr<T>> results;
        for (const auto& behavior : m_behaviors) {
            if (auto result = std::dynamic_pointer_cast<T>(behavior)) {
                results.push_back(result);
            }
        }
        return results;
    }

    template<typename T>
    std::shared_ptr<T> RequireBehavior() const {
        auto behavior = GetBehavior<T>();
        if (!behavior) {
            throw core::MissingComponentError(m_name, typeid(T).name());
        }
        return behavior;
    }

    bool RemoveBehavior(const std::shared_ptr<Behavior>& behavior);
    const std::vector<std::shared_ptr<Behavior>>& GetAllBehaviors() const { return m_behaviors; }

    // Scene membership and lifecycle state
    Scene* GetScene() const { return m_scene; }
    bool IsAwake() const { return m_awake; }
    bool IsStarted() const { return m_started; }
    bool IsDestroyed() const { return m_destroyed; }

    // Lifecycle entry points, driven by Scene. Each recurses into children.
    void Awake();
    void Start();
    void FixedUpdate(float fixedDeltaTime);
    void Update(float deltaTime);
    void LateUpdate(float deltaTime);

private:
    friend class Scene;

    void AttachComponent(const std::shared_ptr<Component>& component);
    void AttachBehavior(const std::shared_ptr<Behavior>& behavior);
    void RemoveChildInternal(const GameObject* child);

    void AwakeBehavior(Behavior& behavior);
    void StartBehavior(Behavior& behavior);
    void TeardownBehavior(Behavior& behavior);

    // Marks this subtree destroyed and runs OnDestroy once per behavior and component.
    void DestroyHierarchy();
    void DispatchCollision(GameObject& other, const ContactInfo& contact, bool isTrigger, bool entered);

    GameObjectId m_id;
    std::string m_name;
    std::string m_tag;
    bool m_enabled = true;
    Transform m_transform;

    GameObject* m_parent = nullptr;
    std::vector<std::shared_ptr<GameObject>> m_children;

    std::vector<std::shared_ptr<Component>> m_components;
    std::vector<std::shared_ptr<Behavior>> m_behaviors;

    Scene* m_scene = nullptr;
    bool m_awake = false;
    bool m_started = false;
    bool m_destroyed = false;
};

template<typename T>
std::shared_ptr<T> Behavior::GetComponent() const {
    return m_owner ? m_owner->GetComponent<T>() : nullptr;
}

template<typename T>
std::shared_ptr<T> Behavior::GetBehavior() const {
    return m_owner ? m_owner->GetBehavior<T>() : nullptr;
}

} // namespace bonk
