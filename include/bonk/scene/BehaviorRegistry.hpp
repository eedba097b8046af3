#pragma once

#include "bonk/scene/Behavior.hpp"
#include "bonk/scene/GameObject.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace bonk::scene {

/**
 * @brief Creates behaviors by script name.
 *
 * Behaviors created here report the registered name from Behavior::GetName,
 * which is what blueprints record and what hook fault logs print.
 */
class BehaviorRegistry {
public:
    using CreatorFunc = std::function<std::shared_ptr<Behavior>()>;

    BehaviorRegistry() = default;
    BehaviorRegistry(const BehaviorRegistry&) = delete;
    BehaviorRegistry& operator=(const BehaviorRegistry&) = delete;

    template<typename T>
    bool Register(const std::string& name) {
        static_assert(std::is_base_of_v<Behavior, T>, "T must inherit from Behavior");
        return Register(name, [] { return std::static_pointer_cast<Behavior>(std::make_shared<T>()); });
    }

    // Returns false if the name is already registered.
    bool Register(const std::string& name, CreatorFunc creator);
    bool Unregister(const std::string& name);

    // Creates the behavior and attaches it to obj. Unknown names log an error and return nullptr.
    std::shared_ptr<Behavior> Create(const std::string& name, GameObject* obj) const;

    bool IsRegistered(const std::string& name) const;
    std::vector<std::string> GetRegisteredNames() const;
    void Clear();

private:
    std::unordered_map<std::string, CreatorFunc> m_creators;
};

} // namespace bonk::scene
