#pragma once

#include "bonk/math/Vector2.hpp"
#include "bonk/scene/BehaviorRegistry.hpp"
#include "bonk/scene/ComponentFactory.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bonk::scene {

struct TransformData {
    Vector2 position{0.0f};
    float rotation = 0.0f;
    Vector2 scale{1.0f};
    int zIndex = 0;
};

struct ComponentBlueprint {
    // ComponentFactory type name.
    std::string kind;
    // Runs after creation, before the object joins a scene.
    std::function<void(Component&)> configure;
};

struct BehaviorBlueprint {
    // BehaviorRegistry name.
    std::string name;
    std::function<void(Behavior&)> configure;
};

/**
 * @brief Plain-data description of a GameObject tree.
 *
 * Loaders fill these in from whatever format they read; the runtime only
 * turns them into objects. Ids are never part of a blueprint.
 */
struct GameObjectBlueprint {
    std::string name = "GameObject";
    std::string tag;
    bool enabled = true;
    TransformData transform;
    std::vector<ComponentBlueprint> components;
    std::vector<BehaviorBlueprint> behaviors;
    std::vector<GameObjectBlueprint> children;
};

class BlueprintBuilder {
public:
    BlueprintBuilder(const ComponentFactory& components, const BehaviorRegistry& behaviors);

    // Returns a detached tree with fresh ids. Unknown component or behavior names are skipped.
    std::shared_ptr<GameObject> Instantiate(const GameObjectBlueprint& blueprint) const;

    // Records names, tags, flags, transforms, component kinds, behavior names and hierarchy.
    // Built-in physics components also keep their configuration.
    static GameObjectBlueprint Capture(const GameObject& gameObject);

private:
    const ComponentFactory& m_components;
    const BehaviorRegistry& m_behaviors;
};

// Id-free, indented description of a tree: one line per object with its name,
// tag, enabled flag, component kinds and behavior names. Equal strings mean
// isomorphic graphs.
std::string GraphShape(const GameObject& gameObject);

} // namespace bonk::scene
