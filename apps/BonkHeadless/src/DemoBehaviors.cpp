#include "DemoBehaviors.hpp"

#include "bonk/core/Logger.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/Scene.hpp"

namespace bonk::demo {

namespace {
constexpr float kHopDelaySeconds = 0.5f;
constexpr float kHopSpeed = -350.0f;
}

void CrateHopper::Start() {
    core::Logger::Info("[Demo] '{}' ready at ({:.1f}, {:.1f})", GetGameObject()->GetName(),
                       GetTransform().GetWorldPosition().x, GetTransform().GetWorldPosition().y);
}

void CrateHopper::OnCollisionEnter(GameObject& other, const ContactInfo& contact) {
    ++m_landings;
    core::Logger::Info("[Demo] '{}' hit '{}' (normal {:.2f}, {:.2f}), landing #{}",
                       GetGameObject()->GetName(), other.GetName(), contact.normal.x, contact.normal.y, m_landings);

    if (m_hopQueued) {
        return;
    }
    m_hopQueued = true;
    StartCoroutine(scene::CoroutineSequence()
                       .WaitSeconds(kHopDelaySeconds)
                       .Then([this] {
                           if (auto body = GetRigidBody()) {
                               body->SetVelocity(Vector2(body->GetVelocity().x, kHopSpeed));
                               core::Logger::Info("[Demo] '{}' hops", GetGameObject()->GetName());
                           }
                           m_hopQueued = false;
                       })
                       .Build());
}

void CrateHopper::OnTriggerEnter(GameObject& other) {
    core::Logger::Info("[Demo] '{}' entered trigger '{}'", GetGameObject()->GetName(), other.GetName());
}

void PositionReporter::Start() {
    StartCoroutine(scene::CoroutineSequence()
                       .WaitSeconds(m_interval)
                       .Then([this] {
                           const Vector2 position = GetTransform().GetWorldPosition();
                           core::Logger::Info("[Demo] t={:.2f}s '{}' at ({:.1f}, {:.1f}) rot {:.1f}",
                                              GetScene()->GetTime().TotalTime(), GetGameObject()->GetName(),
                                              position.x, position.y, GetTransform().GetWorldRotation());
                       })
                       .Loop()
                       .Build());
}

void Fuse::Start() {
    DestroyAfter(m_seconds);
}

void Fuse::OnDestroy() {
    core::Logger::Info("[Demo] '{}' burned out", GetGameObject()->GetName());
}

} // namespace bonk::demo
