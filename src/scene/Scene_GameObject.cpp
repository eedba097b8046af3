#include "bonk/scene/Scene.hpp"

#include "bonk/core/Logger.hpp"

#include <algorithm>

namespace bonk {

namespace {

GameObject* FindByNameRecursive(const std::vector<std::shared_ptr<GameObject>>& objects, const std::string& name) {
    for (const auto& object : objects) {
        if (object->IsDestroyed()) {
            continue;
        }
        if (object->GetName() == name) {
            return object.get();
        }
        if (GameObject* found = FindByNameRecursive(object->GetChildren(), name)) {
            return found;
        }
    }
    return nullptr;
}

void CollectByTag(const std::vector<std::shared_ptr<GameObject>>& objects,
                  const std::string& tag,
                  std::vector<std::shared_ptr<GameObject>>& results) {
    for (const auto& object : objects) {
        if (object->IsDestroyed()) {
            continue;
        }
        if (object->HasTag(tag)) {
            results.push_back(object);
        }
        CollectByTag(object->GetChildren(), tag, results);
    }
}

} // namespace

bool Scene::IsLive(const GameObject& gameObject) const {
    return gameObject.m_scene == this && !gameObject.m_destroyed;
}

std::shared_ptr<GameObject> Scene::CreateGameObject(const std::string& name) {
    auto gameObject = GameObject::Create(name);
    Add(gameObject);
    core::Logger::Debug("[Scene] Created GameObject '{}' (id {})", gameObject->GetName(), gameObject->GetId());
    return gameObject;
}

void Scene::Add(const std::shared_ptr<GameObject>& gameObject) {
    if (!gameObject) {
        core::Logger::Warning("[Scene] Attempted to add a null GameObject to '{}'", m_name);
        return;
    }
    if (m_unloading) {
        core::Logger::Warning("[Scene] Ignoring '{}': scene '{}' is unloading", gameObject->GetName(), m_name);
        return;
    }
    if (gameObject->m_destroyed) {
        core::Logger::Warning("[Scene] Cannot add destroyed GameObject '{}' to '{}'", gameObject->GetName(), m_name);
        return;
    }
    if (gameObject->m_scene == this) {
        return;
    }
    if (gameObject->m_scene) {
        core::Logger::Warning("[Scene] GameObject '{}' already belongs to scene '{}'; remove it there first",
                              gameObject->GetName(), gameObject->m_scene->GetName());
        return;
    }

    // A detached child leaves its detached parent and becomes a root here.
    if (GameObject* parent = gameObject->m_parent) {
        core::Logger::Debug("[Scene] Detaching '{}' from '{}' before adding it as a root",
                            gameObject->GetName(), parent->GetName());
        parent->RemoveChildInternal(gameObject.get());
        gameObject->m_parent = nullptr;
    }

    m_roots.push_back(gameObject);
    RegisterSubtree(*gameObject);
    BringUpToDate(*gameObject);
}

void Scene::Remove(GameObject& gameObject) {
    if (gameObject.m_scene != this) {
        core::Logger::Warning("[Scene] Cannot remove '{}': it is not part of scene '{}'", gameObject.GetName(), m_name);
        return;
    }
    std::shared_ptr<GameObject> keepAlive = gameObject.weak_from_this().lock();
    DetachFromTree(gameObject);
    UnregisterSubtree(gameObject, true);
}

void Scene::Destroy(GameObject& gameObject) {
    if (m_unloading) {
        return;
    }
    if (m_pendingDestroyIds.count(gameObject.GetId()) > 0) {
        return;
    }
    if (!IsLive(gameObject)) {
        core::Logger::Warning("[Scene] Ignoring Destroy('{}'): it is not a live object of scene '{}'",
                              gameObject.GetName(), m_name);
        return;
    }
    std::shared_ptr<GameObject> shared = gameObject.weak_from_this().lock();
    if (!shared) {
        return;
    }
    m_pendingDestroyIds.insert(gameObject.GetId());
    m_pendingDestroy.push_back(std::move(shared));
}

bool Scene::IsPendingDestroy(const GameObject& gameObject) const {
    return m_pendingDestroyIds.count(gameObject.GetId()) > 0;
}

void Scene::ProcessPendingDestroy() {
    // OnDestroy hooks may queue further destruction; drain until stable.
    while (!m_pendingDestroy.empty()) {
        std::vector<std::shared_ptr<GameObject>> batch;
        batch.swap(m_pendingDestroy);

        for (const auto& gameObject : batch) {
            // Cancelled by Remove, already gone with an ancestor, or no longer in this scene.
            if (m_pendingDestroyIds.erase(gameObject->GetId()) == 0 || !IsLive(*gameObject)) {
                continue;
            }

            // Lookups first, so OnDestroy does not find its own object.
            DetachFromTree(*gameObject);
            std::vector<GameObject*> stack{gameObject.get()};
            while (!stack.empty()) {
                GameObject* node = stack.back();
                stack.pop_back();
                m_objectsById.erase(node->GetId());
                for (const auto& child : node->m_children) {
                    stack.push_back(child.get());
                }
            }

            gameObject->DestroyHierarchy();
            UnregisterSubtree(*gameObject, false);
            core::Logger::Debug("[Scene] Destroyed '{}' (id {})", gameObject->GetName(), gameObject->GetId());
        }
    }
}

std::shared_ptr<GameObject> Scene::FindById(GameObjectId id) const {
    auto it = m_objectsById.find(id);
    if (it == m_objectsById.end() || !it->second || it->second->m_destroyed) {
        return nullptr;
    }
    return it->second->weak_from_this().lock();
}

std::shared_ptr<GameObject> Scene::FindByName(const std::string& name) const {
    GameObject* found = FindByNameRecursive(m_roots, name);
    return found ? found->weak_from_this().lock() : nullptr;
}

std::vector<std::shared_ptr<GameObject>> Scene::FindByTag(const std::string& tag) const {
    std::vector<std::shared_ptr<GameObject>> results;
    if (tag.empty()) {
        return results;
    }
    CollectByTag(m_roots, tag, results);
    return results;
}

void Scene::HandleReparent(GameObject& gameObject) {
    if (gameObject.m_scene == this) {
        auto it = std::find_if(m_roots.begin(), m_roots.end(),
                               [&gameObject](const std::shared_ptr<GameObject>& root) {
                                   return root.get() == &gameObject;
                               });
        if (!gameObject.m_parent) {
            if (it == m_roots.end()) {
                if (auto shared = gameObject.weak_from_this().lock()) {
                    m_roots.push_back(std::move(shared));
                }
            }
        } else if (it != m_roots.end()) {
            m_roots.erase(it);
        }
        return;
    }

    // A detached subtree was parented under one of our objects.
    if (!gameObject.m_scene && gameObject.m_parent && gameObject.m_parent->m_scene == this) {
        RegisterSubtree(gameObject);
        BringUpToDate(gameObject);
    }
}

void Scene::RegisterSubtree(GameObject& gameObject) {
    gameObject.m_scene = this;
    m_objectsById[gameObject.GetId()] = &gameObject;

    if (gameObject.m_awake && !gameObject.m_destroyed) {
        for (const auto& component : std::vector<std::shared_ptr<Component>>(gameObject.m_components)) {
            component->OnAddedToScene(*this);
        }
    }

    for (const auto& child : std::vector<std::shared_ptr<GameObject>>(gameObject.m_children)) {
        RegisterSubtree(*child);
    }
}

void Scene::UnregisterSubtree(GameObject& gameObject, bool notifyComponents) {
    for (const auto& child : std::vector<std::shared_ptr<GameObject>>(gameObject.m_children)) {
        UnregisterSubtree(*child, notifyComponents);
    }

    if (notifyComponents && gameObject.m_awake && !gameObject.m_destroyed) {
        for (const auto& component : std::vector<std::shared_ptr<Component>>(gameObject.m_components)) {
            component->OnRemovedFromScene(*this);
        }
    }

    ForgetBodiesOf(gameObject);
    m_objectsById.erase(gameObject.GetId());
    m_pendingDestroyIds.erase(gameObject.GetId());
    gameObject.m_scene = nullptr;
}

void Scene::BringUpToDate(GameObject& gameObject) {
    if (m_awake) {
        gameObject.Awake();
    }
    if (m_started) {
        gameObject.Start();
    }
}

void Scene::DetachFromTree(GameObject& gameObject) {
    if (GameObject* parent = gameObject.m_parent) {
        parent->RemoveChildInternal(&gameObject);
        gameObject.m_parent = nullptr;
        return;
    }
    auto it = std::find_if(m_roots.begin(), m_roots.end(),
                           [&gameObject](const std::shared_ptr<GameObject>& root) {
                               return root.get() == &gameObject;
                           });
    if (it != m_roots.end()) {
        m_roots.erase(it);
    }
}

} // namespace bonk
