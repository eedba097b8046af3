#include "bonk/scene/GameObject.hpp"

#include "bonk/core/Logger.hpp"
#include "bonk/scene/Scene.hpp"

#include "HookGuard.hpp"

#include <atomic>

namespace bonk {

namespace {
std::atomic<GameObjectId> g_nextGameObjectId{1};

template<typename T>
std::vector<std::shared_ptr<T>> Snapshot(const std::vector<std::shared_ptr<T>>& items) {
    return items;
}
} // namespace

GameObject::GameObject(std::string name)
    : m_id(g_nextGameObjectId.fetch_add(1, std::memory_order_relaxed))
    , m_name(std::move(name))
    , m_transform(this) {}

GameObject::~GameObject() {
    for (auto& child : m_children) {
        if (child && child->m_parent == this) {
            child->m_parent = nullptr;
        }
    }
}

std::shared_ptr<GameObject> GameObject::Create(std::string name) {
    return std::make_shared<GameObject>(std::move(name));
}

bool GameObject::IsActiveInHierarchy() const {
    for (const GameObject* node = this; node; node = node->m_parent) {
        if (!node->m_enabled) {
            return false;
        }
    }
    return true;
}

std::shared_ptr<GameObject> GameObject::GetParent() const {
    return m_parent ? m_parent->weak_from_this().lock() : nullptr;
}

bool GameObject::SetParent(const std::shared_ptr<GameObject>& parent) {
    GameObject* target = parent.get();
    if (target == m_parent) {
        return true;
    }
    if (target && (target == this || IsAncestorOf(*target))) {
        throw core::CyclicHierarchyError(m_name, target->m_name);
    }
    if (m_destroyed || (target && target->m_destroyed)) {
        core::Logger::Warning("[GameObject] Cannot reparent '{}': destroyed objects cannot change hierarchy",
                              m_name);
        return false;
    }
    if (target && m_scene && target->m_scene != m_scene) {
        core::Logger::Warning("[GameObject] Cannot parent '{}' under '{}': they do not share a scene",
                              m_name, target->m_name);
        return false;
    }

    std::shared_ptr<GameObject> self = weak_from_this().lock();
    if (!self) {
        core::Logger::Warning("[GameObject] Cannot reparent '{}': it is not owned by a shared_ptr", m_name);
        return false;
    }

    GameObject* oldParent = m_parent;
    if (oldParent) {
        oldParent->RemoveChildInternal(this);
    }
    m_parent = target;
    if (target) {
        target->m_children.push_back(self);
    }

    Scene* scene = m_scene ? m_scene : (target ? target->m_scene : nullptr);
    if (scene) {
        scene->HandleReparent(*this);
    }
    return true;
}

void GameObject::AddChild(const std::shared_ptr<GameObject>& child) {
    if (!child) {
        return;
    }
    std::shared_ptr<GameObject> self = weak_from_this().lock();
    if (!self) {
        core::Logger::Warning("[GameObject] Cannot add child to '{}': it is not owned by a shared_ptr", m_name);
        return;
    }
    child->SetParent(self);
}

std::shared_ptr<GameObject> GameObject::FindChild(const std::string& name, bool recursive) const {
    for (const auto& child : m_children) {
        if (child->m_name == name) {
            return child;
        }
    }
    if (!recursive) {
        return nullptr;
    }
    for (const auto& child : m_children) {
        if (auto found = child->FindChild(name, true)) {
            return found;
        }
    }
    return nullptr;
}

bool GameObject::IsAncestorOf(const GameObject& other) const {
    for (const GameObject* node = other.m_parent; node; node = node->m_parent) {
        if (node == this) {
            return true;
        }
    }
    return false;
}

GameObject& GameObject::GetRoot() {
    GameObject* node = this;
    while (node->m_parent) {
        node = node->m_parent;
    }
    return *node;
}

std::shared_ptr<Component> GameObject::GetComponentByKind(ComponentKind kind) const {
    for (const auto& component : m_components) {
        if (component->GetKind() == kind) {
            return component;
        }
    }
    return nullptr;
}

bool GameObject::RemoveComponent(const std::shared_ptr<Component>& component) {
    auto it = std::find(m_components.begin(), m_components.end(), component);
    if (it == m_components.end()) {
        return false;
    }
    std::shared_ptr<Component> removed = *it;
    m_components.erase(it);
    detail::InvokeHook(*this, removed->GetTypeName(), "OnDestroy", [&] { removed->OnDestroy(); });
    removed->SetOwner(nullptr);
    return true;
}

bool GameObject::RemoveBehavior(const std::shared_ptr<Behavior>& behavior) {
    auto it = std::find(m_behaviors.begin(), m_behaviors.end(), behavior);
    if (it == m_behaviors.end()) {
        return false;
    }
    std::shared_ptr<Behavior> removed = *it;
    m_behaviors.erase(it);
    TeardownBehavior(*removed);
    removed->Attach(nullptr);
    return true;
}

void GameObject::AttachComponent(const std::shared_ptr<Component>& component) {
    if (component->GetOwner() && component->GetOwner() != this) {
        core::Logger::Warning("[GameObject] Component '{}' already belongs to '{}'; moving it to '{}'",
                              component->GetTypeName(), component->GetOwner()->GetName(), m_name);
        component->GetOwner()->RemoveComponent(component);
    }
    component->SetOwner(this);
    m_components.push_back(component);

    // Late additions to a live entity catch up on the hooks they missed.
    if (m_destroyed) {
        return;
    }
    if (m_awake) {
        detail::InvokeHook(*this, component->GetTypeName(), "Awake", [&] { component->Awake(); });
    }
    if (m_started) {
        detail::InvokeHook(*this, component->GetTypeName(), "Start", [&] { component->Start(); });
    }
}

void GameObject::AttachBehavior(const std::shared_ptr<Behavior>& behavior) {
    if (behavior->m_owner && behavior->m_owner != this) {
        core::Logger::Warning("[GameObject] Behavior '{}' already belongs to '{}'; moving it to '{}'",
                              behavior->GetName(), behavior->m_owner->GetName(), m_name);
        behavior->m_owner->RemoveBehavior(behavior);
    }
    behavior->Attach(this);
    m_behaviors.push_back(behavior);

    if (m_destroyed) {
        return;
    }
    if (m_awake) {
        AwakeBehavior(*behavior);
    }
    if (m_started) {
        StartBehavior(*behavior);
    }
}

void GameObject::RemoveChildInternal(const GameObject* child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [child](const std::shared_ptr<GameObject>& candidate) {
                               return candidate.get() == child;
                           });
    if (it != m_children.end()) {
        m_children.erase(it);
    }
}

void GameObject::Awake() {
    if (m_destroyed) {
        return;
    }
    if (!m_awake) {
        m_awake = true;
        for (const auto& component : Snapshot(m_components)) {
            detail::InvokeHook(*this, component->GetTypeName(), "Awake", [&] { component->Awake(); });
        }
        for (const auto& behavior : Snapshot(m_behaviors)) {
            AwakeBehavior(*behavior);
        }
    }
    for (const auto& child : Snapshot(m_children)) {
        child->Awake();
    }
}

void GameObject::Start() {
    if (m_destroyed) {
        return;
    }
    if (!m_awake) {
        Awake();
    }
    if (!m_started) {
        m_started = true;
        for (const auto& component : Snapshot(m_components)) {
            detail::InvokeHook(*this, component->GetTypeName(), "Start", [&] { component->Start(); });
        }
        for (const auto& behavior : Snapshot(m_behaviors)) {
            StartBehavior(*behavior);
        }
    }
    for (const auto& child : Snapshot(m_children)) {
        child->Start();
    }
}

void GameObject::FixedUpdate(float fixedDeltaTime) {
    if (m_destroyed || !m_started || !m_enabled) {
        return;
    }
    for (const auto& behavior : Snapshot(m_behaviors)) {
        if (!behavior->m_enabled || behavior->m_destroyed) {
            continue;
        }
        detail::InvokeHook(*this, behavior->GetName(), "FixedUpdate", [&] { behavior->FixedUpdate(); });
    }
    for (const auto& child : Snapshot(m_children)) {
        child->FixedUpdate(fixedDeltaTime);
    }
}

void GameObject::Update(float deltaTime) {
    if (m_destroyed || !m_started || !m_enabled) {
        return;
    }
    for (const auto& component : Snapshot(m_components)) {
        if (!component->IsEnabled()) {
            continue;
        }
        detail::InvokeHook(*this, component->GetTypeName(), "Update", [&] { component->Update(deltaTime); });
    }
    for (const auto& behavior : Snapshot(m_behaviors)) {
        if (!behavior->m_enabled || behavior->m_destroyed) {
            continue;
        }
        detail::InvokeHook(*this, behavior->GetName(), "Update", [&] { behavior->Update(); });
        // The hook may have disabled or torn down the behavior.
        if (behavior->m_enabled && !behavior->m_destroyed) {
            behavior->TickCoroutines(deltaTime);
        }
    }
    for (const auto& child : Snapshot(m_children)) {
        child->Update(deltaTime);
    }
}

void GameObject::LateUpdate(float deltaTime) {
    if (m_destroyed || !m_started || !m_enabled) {
        return;
    }
    for (const auto& behavior : Snapshot(m_behaviors)) {
        if (!behavior->m_enabled || behavior->m_destroyed) {
            continue;
        }
        detail::InvokeHook(*this, behavior->GetName(), "LateUpdate", [&] { behavior->LateUpdate(); });
    }
    for (const auto& child : Snapshot(m_children)) {
        child->LateUpdate(deltaTime);
    }
}

void GameObject::AwakeBehavior(Behavior& behavior) {
    if (behavior.m_awoken || behavior.m_destroyed) {
        return;
    }
    behavior.m_awoken = true;
    detail::InvokeHook(*this, behavior.GetName(), "Awake", [&] { behavior.Awake(); });
}

void GameObject::StartBehavior(Behavior& behavior) {
    if (behavior.m_started || behavior.m_destroyed) {
        return;
    }
    behavior.m_started = true;
    detail::InvokeHook(*this, behavior.GetName(), "Start", [&] { behavior.Start(); });
}

void GameObject::TeardownBehavior(Behavior& behavior) {
    if (behavior.m_destroyed) {
        return;
    }
    behavior.m_destroyed = true;
    behavior.StopAllCoroutines();
    behavior.m_events.RemoveAllListeners();
    detail::InvokeHook(*this, behavior.GetName(), "OnDestroy", [&] { behavior.OnDestroy(); });
}

void GameObject::DestroyHierarchy() {
    if (m_destroyed) {
        return;
    }
    m_destroyed = true;

    for (const auto& behavior : Snapshot(m_behaviors)) {
        TeardownBehavior(*behavior);
    }
    for (const auto& component : Snapshot(m_components)) {
        detail::InvokeHook(*this, component->GetTypeName(), "OnDestroy", [&] { component->OnDestroy(); });
    }
    for (const auto& child : Snapshot(m_children)) {
        child->DestroyHierarchy();
    }
}

void GameObject::DispatchCollision(GameObject& other, const ContactInfo& contact, bool isTrigger, bool entered) {
    if (m_destroyed) {
        return;
    }
    for (const auto& behavior : Snapshot(m_behaviors)) {
        if (!behavior->m_enabled || behavior->m_destroyed) {
            continue;
        }
        if (isTrigger) {
            if (entered) {
                detail::InvokeHook(*this, behavior->GetName(), "OnTriggerEnter",
                                   [&] { behavior->OnTriggerEnter(other); });
            } else {
                detail::InvokeHook(*this, behavior->GetName(), "OnTriggerExit",
                                   [&] { behavior->OnTriggerExit(other); });
            }
        } else if (entered) {
            detail::InvokeHook(*this, behavior->GetName(), "OnCollisionEnter",
                               [&] { behavior->OnCollisionEnter(other, contact); });
        } else {
            detail::InvokeHook(*this, behavior->GetName(), "OnCollisionExit",
                               [&] { behavior->OnCollisionExit(other); });
        }
    }
}

} // namespace bonk
