#pragma once

#include "bonk/physics/PhysicsTypes.hpp"

namespace bonk::physics {

/**
 * @brief Backend-neutral handle to a simulated body.
 *
 * The mutators are the only way to change simulation state. The id stays
 * the same for the lifetime of the logical body, even when the backend has
 * to rebuild its native object for a new collider.
 */
class PhysicsBody {
public:
    virtual ~PhysicsBody() = default;

    virtual BodyId GetId() const = 0;
    virtual BodyType GetType() const = 0;

    virtual Vector2 GetPosition() const = 0;
    // Degrees.
    virtual float GetRotation() const = 0;
    virtual Vector2 GetVelocity() const = 0;
    // Degrees per second.
    virtual float GetAngularVelocity() const = 0;

    virtual void ApplyForce(const Vector2& force) = 0;
    virtual void ApplyImpulse(const Vector2& impulse) = 0;
    virtual void SetVelocity(const Vector2& velocity) = 0;
    virtual void SetAngularVelocity(float degreesPerSecond) = 0;
    virtual void SetPosition(const Vector2& position) = 0;
    virtual void SetRotation(float degrees) = 0;
};

} // namespace bonk::physics
