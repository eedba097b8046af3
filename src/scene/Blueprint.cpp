#include "bonk/scene/Blueprint.hpp"

#include "bonk/core/Logger.hpp"
#include "bonk/physics/Collider2DComponent.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bonk::scene {

namespace {

std::function<void(Component&)> CaptureConfiguration(const Component& component) {
    if (auto* rigidBody = dynamic_cast<const physics::RigidBody2DComponent*>(&component)) {
        physics::RigidBodyConfig config = rigidBody->GetConfig();
        return [config](Component& target) {
            if (auto* created = dynamic_cast<physics::RigidBody2DComponent*>(&target)) {
                created->SetConfig(config);
            }
        };
    }
    if (auto* collider = dynamic_cast<const physics::Collider2DComponent*>(&component)) {
        physics::ColliderConfig config = collider->GetConfig();
        return [config](Component& target) {
            if (auto* created = dynamic_cast<physics::Collider2DComponent*>(&target)) {
                created->SetConfig(config);
            }
        };
    }
    return {};
}

void AppendShape(const GameObject& gameObject, int depth, std::string& out) {
    std::vector<std::string> components;
    for (const auto& component : gameObject.GetAllComponents()) {
        components.push_back(component->GetTypeName());
    }
    std::vector<std::string> behaviors;
    for (const auto& behavior : gameObject.GetAllBehaviors()) {
        behaviors.push_back(behavior->GetName());
    }

    out += fmt::format("{:{}}{} tag='{}' enabled={} components=[{}] behaviors=[{}]\n",
                       "", depth * 2,
                       gameObject.GetName(),
                       gameObject.GetTag(),
                       gameObject.IsEnabled(),
                       fmt::join(components, ","),
                       fmt::join(behaviors, ","));

    for (const auto& child : gameObject.GetChildren()) {
        AppendShape(*child, depth + 1, out);
    }
}

} // namespace

BlueprintBuilder::BlueprintBuilder(const ComponentFactory& components, const BehaviorRegistry& behaviors)
    : m_components(components)
    , m_behaviors(behaviors) {}

std::shared_ptr<GameObject> BlueprintBuilder::Instantiate(const GameObjectBlueprint& blueprint) const {
    auto gameObject = GameObject::Create(blueprint.name);
    gameObject->SetTag(blueprint.tag);
    gameObject->SetEnabled(blueprint.enabled);

    Transform& transform = gameObject->GetTransform();
    transform.SetLocalPosition(blueprint.transform.position);
    transform.SetLocalRotation(blueprint.transform.rotation);
    transform.SetLocalScale(blueprint.transform.scale);
    transform.SetZIndex(blueprint.transform.zIndex);

    for (const auto& entry : blueprint.components) {
        auto component = m_components.Create(entry.kind, gameObject.get());
        if (!component) {
            core::Logger::Error("[Blueprint] Skipped component '{}' on '{}'", entry.kind, blueprint.name);
            continue;
        }
        if (entry.configure) {
            try {
                entry.configure(*component);
            } catch (const std::exception& ex) {
                core::Logger::Error("[Blueprint] Configuring component '{}' on '{}' failed: {}",
                                    entry.kind, blueprint.name, ex.what());
            }
        }
    }

    for (const auto& entry : blueprint.behaviors) {
        auto behavior = m_behaviors.Create(entry.name, gameObject.get());
        if (!behavior) {
            core::Logger::Error("[Blueprint] Skipped behavior '{}' on '{}'", entry.name, blueprint.name);
            continue;
        }
        if (entry.configure) {
            try {
                entry.configure(*behavior);
            } catch (const std::exception& ex) {
                core::Logger::Error("[Blueprint] Configuring behavior '{}' on '{}' failed: {}",
                                    entry.name, blueprint.name, ex.what());
            }
        }
    }

    for (const auto& childBlueprint : blueprint.children) {
        gameObject->AddChild(Instantiate(childBlueprint));
    }
    return gameObject;
}

GameObjectBlueprint BlueprintBuilder::Capture(const GameObject& gameObject) {
    GameObjectBlueprint blueprint;
    blueprint.name = gameObject.GetName();
    blueprint.tag = gameObject.GetTag();
    blueprint.enabled = gameObject.IsEnabled();

    const Transform& transform = gameObject.GetTransform();
    blueprint.transform.position = transform.GetLocalPosition();
    blueprint.transform.rotation = transform.GetLocalRotation();
    blueprint.transform.scale = transform.GetLocalScale();
    blueprint.transform.zIndex = transform.GetZIndex();

    for (const auto& component : gameObject.GetAllComponents()) {
        blueprint.components.push_back(ComponentBlueprint{component->GetTypeName(), CaptureConfiguration(*component)});
    }

    for (const auto& behavior : gameObject.GetAllBehaviors()) {
        BehaviorBlueprint entry{behavior->GetName(), {}};
        if (!behavior->IsEnabled()) {
            entry.configure = [](Behavior& created) { created.SetEnabled(false); };
        }
        blueprint.behaviors.push_back(std::move(entry));
    }

    for (const auto& child : gameObject.GetChildren()) {
        blueprint.children.push_back(Capture(*child));
    }
    return blueprint;
}

std::string GraphShape(const GameObject& gameObject) {
    std::string out;
    AppendShape(gameObject, 0, out);
    return out;
}

} // namespace bonk::scene
