#include "bonk/scene/BehaviorRegistry.hpp"

#include "bonk/core/Logger.hpp"

#include <algorithm>
#include <utility>

namespace bonk::scene {

bool BehaviorRegistry::Register(const std::string& name, CreatorFunc creator) {
    if (name.empty() || !creator) {
        core::Logger::Warning("[BehaviorRegistry] Ignoring registration with an empty name or creator");
        return false;
    }
    if (!m_creators.emplace(name, std::move(creator)).second) {
        core::Logger::Warning("[BehaviorRegistry] Behavior '{}' is already registered", name);
        return false;
    }
    return true;
}

bool BehaviorRegistry::Unregister(const std::string& name) {
    return m_creators.erase(name) > 0;
}

std::shared_ptr<Behavior> BehaviorRegistry::Create(const std::string& name, GameObject* obj) const {
    if (!obj) {
        core::Logger::Error("[BehaviorRegistry] Cannot create behavior '{}': invalid GameObject", name);
        return nullptr;
    }

    auto it = m_creators.find(name);
    if (it == m_creators.end()) {
        core::Logger::Error("[BehaviorRegistry] Behavior '{}' is not registered", name);
        return nullptr;
    }

    std::shared_ptr<Behavior> behavior;
    try {
        behavior = it->second();
    } catch (const std::exception& ex) {
        core::Logger::Error("[BehaviorRegistry] Exception while creating behavior '{}': {}", name, ex.what());
        return nullptr;
    }
    if (!behavior) {
        core::Logger::Error("[BehaviorRegistry] Creator function returned null for '{}'", name);
        return nullptr;
    }

    // Named before attaching so catch-up hooks already log the script name.
    behavior->m_registeredName = name;
    obj->AddBehavior(behavior);
    return behavior;
}

bool BehaviorRegistry::IsRegistered(const std::string& name) const {
    return m_creators.find(name) != m_creators.end();
}

std::vector<std::string> BehaviorRegistry::GetRegisteredNames() const {
    std::vector<std::string> names;
    names.reserve(m_creators.size());
    for (const auto& pair : m_creators) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void BehaviorRegistry::Clear() {
    m_creators.clear();
}

} // namespace bonk::scene
