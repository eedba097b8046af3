#include "bonk/scene/Transform.hpp"

#include "bonk/scene/GameObject.hpp"

#include <glm/matrix.hpp>
#include <glm/trigonometric.hpp>

#include <cmath>

namespace bonk {

glm::mat3 Transform::GetLocalMatrix() const {
    const float radians = glm::radians(m_rotation);
    const float c = std::cos(radians);
    const float s = std::sin(radians);

    glm::mat3 matrix(1.0f);
    matrix[0] = glm::vec3(c * m_scale.x, s * m_scale.x, 0.0f);
    matrix[1] = glm::vec3(-s * m_scale.y, c * m_scale.y, 0.0f);
    matrix[2] = glm::vec3(m_position.x, m_position.y, 1.0f);
    return matrix;
}

glm::mat3 Transform::GetWorldMatrix() const {
    glm::mat3 world = GetLocalMatrix();
    for (const Transform* parent = GetParentTransform(); parent; parent = parent->GetParentTransform()) {
        world = parent->GetLocalMatrix() * world;
    }
    return world;
}

Vector2 Transform::GetWorldPosition() const {
    const Transform* parent = GetParentTransform();
    if (!parent) {
        return m_position;
    }
    return parent->TransformPoint(m_position);
}

float Transform::GetWorldRotation() const {
    float rotation = m_rotation;
    for (const Transform* parent = GetParentTransform(); parent; parent = parent->GetParentTransform()) {
        rotation += parent->m_rotation;
    }
    return rotation;
}

Vector2 Transform::GetWorldScale() const {
    Vector2 scale = m_scale;
    for (const Transform* parent = GetParentTransform(); parent; parent = parent->GetParentTransform()) {
        scale *= parent->m_scale;
    }
    return scale;
}

void Transform::SetWorldPosition(const Vector2& position) {
    const Transform* parent = GetParentTransform();
    if (!parent) {
        m_position = position;
        return;
    }
    m_position = parent->InverseTransformPoint(position);
}

void Transform::SetWorldRotation(float degrees) {
    const Transform* parent = GetParentTransform();
    m_rotation = parent ? degrees - parent->GetWorldRotation() : degrees;
}

Vector2 Transform::TransformPoint(const Vector2& localPoint) const {
    const glm::vec3 world = GetWorldMatrix() * glm::vec3(localPoint, 1.0f);
    return Vector2(world.x, world.y);
}

Vector2 Transform::InverseTransformPoint(const Vector2& worldPoint) const {
    const glm::mat3 world = GetWorldMatrix();
    // A zero scale anywhere up the chain leaves nothing to invert.
    if (std::abs(glm::determinant(world)) <= 1e-12f) {
        return Vector2(0.0f);
    }
    const glm::vec3 local = glm::inverse(world) * glm::vec3(worldPoint, 1.0f);
    return Vector2(local.x, local.y);
}

Vector2 Transform::GetRight() const {
    return math::Rotate(Vector2(1.0f, 0.0f), GetWorldRotation());
}

Vector2 Transform::GetUp() const {
    // Screen space: y grows downwards, so "up" is -y.
    return math::Rotate(Vector2(0.0f, -1.0f), GetWorldRotation());
}

void Transform::Reset() {
    m_position = Vector2(0.0f);
    m_rotation = 0.0f;
    m_scale = Vector2(1.0f);
    m_zIndex = 0;
}

const Transform* Transform::GetParentTransform() const {
    if (!m_owner) {
        return nullptr;
    }
    GameObject* parent = m_owner->GetParentPtr();
    return parent ? &parent->GetTransform() : nullptr;
}

} // namespace bonk
