#pragma once

#include "bonk/core/Logger.hpp"
#include "bonk/scene/GameObject.hpp"

#include <exception>
#include <string>
#include <utility>

namespace bonk::detail {

// Runs one script hook. A thrown std::exception is logged with enough context
// to find the script and does not propagate into the frame.
template<typename Fn>
bool InvokeHook(const GameObject& owner, const std::string& scriptName, const char* hook, Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
        return true;
    } catch (const std::exception& ex) {
        core::Logger::Error("[Scene] {}.{} on '{}' (id {}) threw: {}",
                            scriptName, hook, owner.GetName(), owner.GetId(), ex.what());
        return false;
    }
}

} // namespace bonk::detail
