#include "bonk/scene/Component.hpp"

namespace bonk {

const char* ToString(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::RigidBody2D: return "RigidBody2D";
        case ComponentKind::Collider2D:  return "Collider2D";
        case ComponentKind::Custom:      return "Custom";
    }
    return "Unknown";
}

} // namespace bonk
