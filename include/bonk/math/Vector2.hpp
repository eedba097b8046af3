#pragma once

#include <glm/vec2.hpp>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include <cmath>

namespace bonk {

using Vector2 = glm::vec2;

namespace math {

// Rotates counter-clockwise in a y-up frame (clockwise on a y-down screen).
inline Vector2 Rotate(const Vector2& v, float degrees) {
    const float radians = glm::radians(degrees);
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    return { v.x * c - v.y * s, v.x * s + v.y * c };
}

inline Vector2 NormalizeOrZero(const Vector2& v) {
    const float len = glm::length(v);
    if (len <= 0.0f) {
        return Vector2(0.0f);
    }
    return v / len;
}

} // namespace math
} // namespace bonk
