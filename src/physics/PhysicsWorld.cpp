#include "bonk/physics/PhysicsWorld.hpp"

#include "bonk/core/Error.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/JoltPhysicsWorld.hpp"

#include <algorithm>
#include <cmath>

namespace bonk::physics {

const char* ToString(BodyType type) {
    switch (type) {
        case BodyType::Dynamic:   return "dynamic";
        case BodyType::Static:    return "static";
        case BodyType::Kinematic: return "kinematic";
    }
    return "unknown";
}

const char* ToString(ColliderShape shape) {
    switch (shape) {
        case ColliderShape::Box:     return "box";
        case ColliderShape::Circle:  return "circle";
        case ColliderShape::Polygon: return "polygon";
    }
    return "unknown";
}

PhysicsWorld::PhysicsWorld(const PhysicsWorldConfig& config) {
    if (std::isfinite(config.pixelsPerUnit) && config.pixelsPerUnit > 0.0f) {
        m_pixelsPerUnit = config.pixelsPerUnit;
    } else {
        core::Logger::Warning("[PhysicsWorld] pixelsPerUnit {} is invalid, using {}",
                              config.pixelsPerUnit, m_pixelsPerUnit);
    }
}

CallbackId PhysicsWorld::OnCollisionStart(CollisionCallback callback) {
    if (!callback) {
        return 0;
    }
    const CallbackId id = m_nextCallbackId++;
    m_startCallbacks.emplace_back(id, std::move(callback));
    return id;
}

CallbackId PhysicsWorld::OnCollisionEnd(CollisionCallback callback) {
    if (!callback) {
        return 0;
    }
    const CallbackId id = m_nextCallbackId++;
    m_endCallbacks.emplace_back(id, std::move(callback));
    return id;
}

bool PhysicsWorld::RemoveCollisionCallback(CallbackId id) {
    auto removeFrom = [id](CallbackList& list) {
        auto it = std::remove_if(list.begin(), list.end(),
                                 [id](const auto& entry) { return entry.first == id; });
        const bool removed = it != list.end();
        list.erase(it, list.end());
        return removed;
    };
    const bool removedStart = removeFrom(m_startCallbacks);
    const bool removedEnd = removeFrom(m_endCallbacks);
    return removedStart || removedEnd;
}

void PhysicsWorld::DispatchCollisionStart(const CollisionEvent& event) {
    Dispatch(m_startCallbacks, event);
}

void PhysicsWorld::DispatchCollisionEnd(const CollisionEvent& event) {
    Dispatch(m_endCallbacks, event);
}

void PhysicsWorld::Dispatch(const CallbackList& callbacks, const CollisionEvent& event) {
    // Callbacks may unregister themselves.
    const CallbackList snapshot = callbacks;
    for (const auto& [id, callback] : snapshot) {
        if (callback) {
            callback(event);
        }
    }
}

PhysicsBackendRegistry& PhysicsBackendRegistry::Default() {
    static PhysicsBackendRegistry s_registry = [] {
        PhysicsBackendRegistry registry;
        registry.Register(JoltPhysicsWorld::kBackendName, [](const PhysicsWorldConfig& config) {
            return std::unique_ptr<PhysicsWorld>(std::make_unique<JoltPhysicsWorld>(config));
        });
        return registry;
    }();
    return s_registry;
}

bool PhysicsBackendRegistry::Register(const std::string& name, Factory factory) {
    if (name.empty() || !factory) {
        core::Logger::Warning("[PhysicsBackendRegistry] Ignoring invalid backend registration '{}'", name);
        return false;
    }
    if (IsRegistered(name)) {
        core::Logger::Warning("[PhysicsBackendRegistry] Backend '{}' is already registered", name);
        return false;
    }
    m_factories.emplace_back(name, std::move(factory));
    return true;
}

bool PhysicsBackendRegistry::Unregister(const std::string& name) {
    auto it = std::find_if(m_factories.begin(), m_factories.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it == m_factories.end()) {
        return false;
    }
    m_factories.erase(it);
    return true;
}

bool PhysicsBackendRegistry::IsRegistered(const std::string& name) const {
    return std::any_of(m_factories.begin(), m_factories.end(),
                       [&name](const auto& entry) { return entry.first == name; });
}

std::unique_ptr<PhysicsWorld> PhysicsBackendRegistry::Create(const std::string& name,
                                                             const PhysicsWorldConfig& config) const {
    auto it = std::find_if(m_factories.begin(), m_factories.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it == m_factories.end()) {
        throw core::UnknownPhysicsBackendError(name, GetBackendNames());
    }
    std::unique_ptr<PhysicsWorld> world = it->second(config);
    if (!world) {
        throw core::PhysicsError("backend creation", "factory for '" + name + "' returned no world");
    }
    return world;
}

std::vector<std::string> PhysicsBackendRegistry::GetBackendNames() const {
    std::vector<std::string> names;
    names.reserve(m_factories.size());
    for (const auto& entry : m_factories) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace bonk::physics
