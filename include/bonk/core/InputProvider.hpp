#pragma once

#include "bonk/math/Vector2.hpp"

#include <string>

namespace bonk::core {

/**
 * @brief Query surface of the host's input layer.
 *
 * Device polling lives outside the runtime. Behaviors reach this through
 * their helper calls during the update phases.
 */
class InputProvider {
public:
    virtual ~InputProvider() = default;

    // Smoothed axis in [-1, 1].
    virtual float GetAxis(const std::string& name) const = 0;
    // -1, 0 or 1.
    virtual float GetAxisRaw(const std::string& name) const = 0;

    virtual bool GetButton(const std::string& name) const = 0;
    virtual bool GetButtonDown(const std::string& name) const = 0;
    virtual bool GetButtonUp(const std::string& name) const = 0;

    virtual bool GetKey(const std::string& code) const = 0;
    virtual bool GetKeyDown(const std::string& code) const = 0;
    virtual bool GetKeyUp(const std::string& code) const = 0;

    virtual Vector2 GetMousePosition() const = 0;
    // 0 = left, 1 = middle, 2 = right.
    virtual bool GetMouseButton(int button) const = 0;
    virtual bool GetMouseButtonDown(int button) const = 0;
};

} // namespace bonk::core
