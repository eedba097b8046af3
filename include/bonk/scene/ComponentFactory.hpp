#pragma once

#include "bonk/scene/Component.hpp"
#include "bonk/scene/GameObject.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace bonk::scene {

/**
 * @brief Creates components by type name.
 *
 * Used by blueprints and external loaders to attach components they only
 * know by name. Each factory is an independent instance; call
 * RegisterBuiltinComponents to add RigidBody2D and Collider2D.
 *
 * @example
 * ComponentFactory factory;
 * factory.Register<HealthComponent>("Health");
 * auto component = factory.Create("Health", gameObject.get());
 */
class ComponentFactory {
public:
    using CreatorFunc = std::function<std::shared_ptr<Component>(GameObject*)>;

    ComponentFactory() = default;
    ComponentFactory(const ComponentFactory&) = delete;
    ComponentFactory& operator=(const ComponentFactory&) = delete;

    /**
     * @brief Register a component type with the factory.
     *
     * @return false if typeName is already registered
     */
    template<typename T>
    bool Register(const std::string& typeName) {
        static_assert(std::is_base_of_v<Component, T>,
                      "T must inherit from Component");
        return Register(typeName, [](GameObject* obj) -> std::shared_ptr<Component> {
            return obj->AddComponent<T>();
        });
    }

    bool Register(const std::string& typeName, CreatorFunc creator);
    bool Unregister(const std::string& typeName);

    /**
     * @brief Create a component by name and attach it to obj.
     *
     * @return nullptr if the name is unknown or the creator failed
     */
    std::shared_ptr<Component> Create(const std::string& typeName, GameObject* obj) const;

    bool IsRegistered(const std::string& typeName) const;
    // Sorted by name.
    std::vector<std::string> GetRegisteredTypes() const;
    void Clear();

private:
    std::unordered_map<std::string, CreatorFunc> m_creators;
};

// Registers "RigidBody2D" and "Collider2D".
void RegisterBuiltinComponents(ComponentFactory& factory);

} // namespace bonk::scene
