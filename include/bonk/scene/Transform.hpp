#pragma once

#include "bonk/math/Vector2.hpp"

#include <glm/mat3x3.hpp>

namespace bonk {

class GameObject;

/**
 * @brief Local pose of a GameObject relative to its parent.
 *
 * Rotation is in degrees. World values are recomputed on every read by
 * folding the parent chain, so they are always consistent with the current
 * hierarchy.
 */
class Transform {
public:
    explicit Transform(GameObject* owner = nullptr) : m_owner(owner) {}

    const Vector2& GetLocalPosition() const { return m_position; }
    void SetLocalPosition(const Vector2& position) { m_position = position; }
    void SetLocalPosition(float x, float y) { m_position = Vector2(x, y); }

    float GetLocalRotation() const { return m_rotation; }
    void SetLocalRotation(float degrees) { m_rotation = degrees; }

    const Vector2& GetLocalScale() const { return m_scale; }
    void SetLocalScale(const Vector2& scale) { m_scale = scale; }
    void SetLocalScale(float uniform) { m_scale = Vector2(uniform); }

    int GetZIndex() const { return m_zIndex; }
    void SetZIndex(int zIndex) { m_zIndex = zIndex; }

    void Translate(const Vector2& delta) { m_position += delta; }
    void Rotate(float degrees) { m_rotation += degrees; }

    // Translation * rotation * scale.
    glm::mat3 GetLocalMatrix() const;
    glm::mat3 GetWorldMatrix() const;

    Vector2 GetWorldPosition() const;
    float GetWorldRotation() const;
    Vector2 GetWorldScale() const;

    // Solve for the local value that produces the requested world value.
    void SetWorldPosition(const Vector2& position);
    void SetWorldRotation(float degrees);

    Vector2 TransformPoint(const Vector2& localPoint) const;
    Vector2 InverseTransformPoint(const Vector2& worldPoint) const;

    // Unit vectors of the local axes in world space.
    Vector2 GetRight() const;
    Vector2 GetUp() const;

    void Reset();

    GameObject* GetOwner() const { return m_owner; }

private:
    friend class GameObject;

    const Transform* GetParentTransform() const;

    GameObject* m_owner = nullptr;
    Vector2 m_position{0.0f};
    float m_rotation = 0.0f;
    Vector2 m_scale{1.0f};
    int m_zIndex = 0;
};

} // namespace bonk
