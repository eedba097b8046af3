#include "bonk/core/EventEmitter.hpp"

#include <algorithm>
#include <utility>

namespace bonk {
namespace core {

EventEmitter::SubscriptionHandle::SubscriptionHandle(std::weak_ptr<State> state,
                                                     std::string eventName,
                                                     SubscriptionId id)
    : m_state(std::move(state))
    , m_eventName(std::move(eventName))
    , m_id(id) {}

EventEmitter::SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : m_state(std::move(other.m_state))
    , m_eventName(std::move(other.m_eventName))
    , m_id(other.m_id) {
    other.m_id = 0;
    other.m_eventName.clear();
}

EventEmitter::SubscriptionHandle& EventEmitter::SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        m_state = std::move(other.m_state);
        m_eventName = std::move(other.m_eventName);
        m_id = other.m_id;
        other.m_id = 0;
        other.m_eventName.clear();
    }
    return *this;
}

void EventEmitter::SubscriptionHandle::Reset() {
    if (m_id == 0) {
        return;
    }
    if (auto state = m_state.lock()) {
        EventEmitter::Deactivate(*state, m_eventName, m_id);
    }
    m_state.reset();
    m_eventName.clear();
    m_id = 0;
}

EventEmitter::ScopedSubscription::ScopedSubscription(SubscriptionHandle handle)
    : m_handle(std::move(handle)) {}

EventEmitter::ScopedSubscription& EventEmitter::ScopedSubscription::operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
        m_handle.Reset();
        m_handle = std::move(other.m_handle);
    }
    return *this;
}

EventEmitter::ScopedSubscription::~ScopedSubscription() {
    Reset();
}

void EventEmitter::ScopedSubscription::Reset() {
    m_handle.Reset();
}

EventEmitter::EventEmitter()
    : m_state(std::make_shared<State>()) {}

EventEmitter::SubscriptionHandle EventEmitter::Subscribe(const std::string& eventName, Callback callback) {
    return AddListener(eventName, std::move(callback), false);
}

EventEmitter::SubscriptionHandle EventEmitter::SubscribeOnce(const std::string& eventName, Callback callback) {
    return AddListener(eventName, std::move(callback), true);
}

EventEmitter::SubscriptionHandle EventEmitter::AddListener(const std::string& eventName,
                                                           Callback callback,
                                                           bool once) {
    if (!callback) {
        return {};
    }
    const SubscriptionId id = m_state->nextId++;
    m_state->listeners[eventName].push_back(Entry{ id, std::move(callback), once, true });
    return SubscriptionHandle(m_state, eventName, id);
}

void EventEmitter::Emit(const std::string& eventName, const std::any& payload) {
    // Keep the state alive even if a listener tears down the owner.
    std::shared_ptr<State> state = m_state;
    auto it = state->listeners.find(eventName);
    if (it == state->listeners.end()) {
        return;
    }

    // Listeners added while emitting wait for the next Emit.
    const std::size_t count = it->second.size();
    ++state->emitDepth;
    for (std::size_t i = 0; i < count; ++i) {
        auto listIt = state->listeners.find(eventName);
        if (listIt == state->listeners.end() || i >= listIt->second.size()) {
            break;
        }
        Entry& entry = listIt->second[i];
        if (!entry.active || !entry.callback) {
            continue;
        }
        if (entry.once) {
            entry.active = false;
        }
        Callback callback = entry.callback;
        callback(payload);
    }
    --state->emitDepth;

    Compact(*state, eventName);
}

void EventEmitter::Unsubscribe(SubscriptionHandle& handle) {
    handle.Reset();
}

void EventEmitter::RemoveAllListeners(const std::string& eventName) {
    auto it = m_state->listeners.find(eventName);
    if (it == m_state->listeners.end()) {
        return;
    }
    for (auto& entry : it->second) {
        entry.active = false;
    }
    Compact(*m_state, eventName);
}

void EventEmitter::RemoveAllListeners() {
    for (auto& [name, entries] : m_state->listeners) {
        for (auto& entry : entries) {
            entry.active = false;
        }
    }
    if (m_state->emitDepth == 0) {
        m_state->listeners.clear();
    }
}

std::size_t EventEmitter::ListenerCount(const std::string& eventName) const {
    auto it = m_state->listeners.find(eventName);
    if (it == m_state->listeners.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
                                                  [](const Entry& entry) { return entry.active; }));
}

void EventEmitter::Deactivate(State& state, const std::string& eventName, SubscriptionId id) {
    auto it = state.listeners.find(eventName);
    if (it == state.listeners.end()) {
        return;
    }
    for (auto& entry : it->second) {
        if (entry.active && entry.id == id) {
            entry.active = false;
            break;
        }
    }
    Compact(state, eventName);
}

void EventEmitter::Compact(State& state, const std::string& eventName) {
    if (state.emitDepth > 0) {
        return;
    }
    auto it = state.listeners.find(eventName);
    if (it == state.listeners.end()) {
        return;
    }
    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const Entry& entry) { return !entry.active || !entry.callback; }),
               list.end());
    if (list.empty()) {
        state.listeners.erase(it);
    }
}

}} // namespace bonk::core
