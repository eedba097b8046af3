#include "bonk/scene/Behavior.hpp"

#include "bonk/core/InputProvider.hpp"
#include "bonk/core/Logger.hpp"
#include "bonk/physics/RigidBody2DComponent.hpp"
#include "bonk/scene/GameObject.hpp"
#include "bonk/scene/Scene.hpp"

#include <typeinfo>

namespace bonk {

namespace {
core::InputProvider* InputOf(const Behavior& behavior) {
    Scene* scene = behavior.GetScene();
    return scene ? scene->GetInputProvider() : nullptr;
}
} // namespace

std::string Behavior::GetName() const {
    if (!m_registeredName.empty()) {
        return m_registeredName;
    }
    return typeid(*this).name();
}

Transform& Behavior::GetTransform() const {
    if (!m_owner) {
        throw core::Error("Behavior '" + GetName() + "' is not attached to a GameObject");
    }
    return m_owner->GetTransform();
}

Scene* Behavior::GetScene() const {
    return m_owner ? m_owner->GetScene() : nullptr;
}

void Behavior::Attach(GameObject* owner) {
    m_owner = owner;
    m_scheduler.SetFaultHandler([this](const std::exception& ex) {
        core::Logger::Error("[Scene] Coroutine of {} on '{}' threw and was stopped: {}",
                            GetName(), m_owner ? m_owner->GetName() : std::string("<detached>"), ex.what());
    });
}

void Behavior::TickCoroutines(float deltaTime) {
    m_scheduler.Update(deltaTime);
}

scene::CoroutineHandle Behavior::StartCoroutine(scene::Coroutine coroutine) {
    if (m_destroyed) {
        core::Logger::Warning("[Scene] {} cannot start a coroutine after it was destroyed", GetName());
        return {};
    }
    return m_scheduler.Start(std::move(coroutine));
}

bool Behavior::StopCoroutine(const scene::CoroutineHandle& handle) {
    return m_scheduler.Stop(handle);
}

void Behavior::StopAllCoroutines() {
    m_scheduler.StopAll();
}

std::shared_ptr<physics::RigidBody2DComponent> Behavior::GetRigidBody() const {
    return GetComponent<physics::RigidBody2DComponent>();
}

std::shared_ptr<GameObject> Behavior::Find(const std::string& name) const {
    Scene* scene = GetScene();
    return scene ? scene->FindByName(name) : nullptr;
}

std::vector<std::shared_ptr<GameObject>> Behavior::FindWithTag(const std::string& tag) const {
    Scene* scene = GetScene();
    if (!scene) {
        return {};
    }
    return scene->FindByTag(tag);
}

void Behavior::Destroy() {
    if (m_owner) {
        Destroy(*m_owner);
    }
}

void Behavior::Destroy(GameObject& target) {
    Scene* scene = target.GetScene();
    if (!scene) {
        core::Logger::Warning("[Scene] {} asked to destroy '{}', which is not in a scene", GetName(), target.GetName());
        return;
    }
    scene->Destroy(target);
}

scene::CoroutineHandle Behavior::DestroyAfter(float seconds) {
    return DestroyAfter(seconds, m_owner ? m_owner->weak_from_this().lock() : nullptr);
}

scene::CoroutineHandle Behavior::DestroyAfter(float seconds, const std::shared_ptr<GameObject>& target) {
    if (!target) {
        return {};
    }
    std::weak_ptr<GameObject> weakTarget = target;
    return StartCoroutine(scene::CoroutineSequence()
                              .WaitSeconds(seconds)
                              .Then([this, weakTarget] {
                                  if (auto object = weakTarget.lock()) {
                                      if (!object->IsDestroyed()) {
                                          Destroy(*object);
                                      }
                                  }
                              })
                              .Build());
}

float Behavior::DeltaTime() const {
    Scene* scene = GetScene();
    return scene ? scene->GetTime().DeltaTime() : 0.0f;
}

float Behavior::FixedDeltaTime() const {
    Scene* scene = GetScene();
    return scene ? scene->GetTime().FixedDeltaTime() : core::Time::kDefaultFixedDeltaTime;
}

float Behavior::TimeScale() const {
    Scene* scene = GetScene();
    return scene ? scene->GetTime().TimeScale() : 1.0f;
}

void Behavior::SetTimeScale(float scale) {
    if (Scene* scene = GetScene()) {
        scene->GetTime().SetTimeScale(scale);
    }
}

float Behavior::GetAxis(const std::string& name) const {
    auto* input = InputOf(*this);
    return input ? input->GetAxis(name) : 0.0f;
}

float Behavior::GetAxisRaw(const std::string& name) const {
    auto* input = InputOf(*this);
    return input ? input->GetAxisRaw(name) : 0.0f;
}

bool Behavior::GetButton(const std::string& name) const {
    auto* input = InputOf(*this);
    return input && input->GetButton(name);
}

bool Behavior::GetButtonDown(const std::string& name) const {
    auto* input = InputOf(*this);
    return input && input->GetButtonDown(name);
}

bool Behavior::GetButtonUp(const std::string& name) const {
    auto* input = InputOf(*this);
    return input && input->GetButtonUp(name);
}

bool Behavior::GetKey(const std::string& code) const {
    auto* input = InputOf(*this);
    return input && input->GetKey(code);
}

bool Behavior::GetKeyDown(const std::string& code) const {
    auto* input = InputOf(*this);
    return input && input->GetKeyDown(code);
}

bool Behavior::GetKeyUp(const std::string& code) const {
    auto* input = InputOf(*this);
    return input && input->GetKeyUp(code);
}

Vector2 Behavior::GetMousePosition() const {
    auto* input = InputOf(*this);
    return input ? input->GetMousePosition() : Vector2(0.0f);
}

bool Behavior::GetMouseButton(int button) const {
    auto* input = InputOf(*this);
    return input && input->GetMouseButton(button);
}

bool Behavior::GetMouseButtonDown(int button) const {
    auto* input = InputOf(*this);
    return input && input->GetMouseButtonDown(button);
}

} // namespace bonk
