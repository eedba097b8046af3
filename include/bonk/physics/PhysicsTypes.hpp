#pragma once

#include "bonk/math/Vector2.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bonk::physics {

class PhysicsBody;

using BodyId = std::uint64_t;
constexpr BodyId kInvalidBodyId = 0;

enum class BodyType {
    Dynamic,
    Static,
    Kinematic
};

enum class ColliderShape {
    Box,
    Circle,
    Polygon
};

const char* ToString(BodyType type);
const char* ToString(ColliderShape shape);

/**
 * @brief Creation parameters for a body. Units are pixels and degrees.
 */
struct RigidBodyConfig {
    BodyType type = BodyType::Dynamic;
    Vector2 position{0.0f};
    float rotation = 0.0f;
    // Unset means "derive from the collider's area".
    std::optional<float> mass;
    float friction = 0.1f;
    float restitution = 0.0f;
    float linearDamping = 0.01f;
    float angularDamping = 0.0f;
    bool fixedRotation = false;
    bool bullet = false;
    float gravityScale = 1.0f;
};

struct ColliderConfig {
    ColliderShape shape = ColliderShape::Box;
    bool isTrigger = false;
    Vector2 offset{0.0f};
    // Empty layer means "default". Empty mask means "collide with every layer".
    std::string layer;
    std::vector<std::string> mask;
    float width = 32.0f;
    float height = 32.0f;
    float radius = 16.0f;
    std::vector<Vector2> vertices;
};

struct ContactPoint {
    Vector2 point{0.0f};
    // Points away from the first body of the pair.
    Vector2 normal{0.0f};
};

struct RaycastHit {
    PhysicsBody* body = nullptr;
    Vector2 point{0.0f};
    Vector2 normal{0.0f};
    float distance = 0.0f;
};

struct CollisionEvent {
    PhysicsBody* bodyA = nullptr;
    PhysicsBody* bodyB = nullptr;
    std::vector<ContactPoint> contacts;
    bool isSensor = false;
};

using CollisionCallback = std::function<void(const CollisionEvent&)>;
using CallbackId = std::uint64_t;

struct PhysicsWorldConfig {
    Vector2 gravity{0.0f, 980.0f};
    float pixelsPerUnit = 100.0f;
    std::uint32_t maxBodies = 4096;
};

} // namespace bonk::physics
