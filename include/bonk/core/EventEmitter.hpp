#pragma once
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace bonk {
namespace core {

/**
 * @brief Named publish/subscribe channel scoped to its owner.
 *
 * Each Behavior owns one. Handles keep only a weak link to the emitter, so
 * a handle that outlives its emitter resets to a no-op.
 */
class EventEmitter {
public:
    using Callback = std::function<void(const std::any&)>;
    using SubscriptionId = std::uint64_t;

private:
    struct Entry {
        SubscriptionId id = 0;
        Callback callback;
        bool once = false;
        bool active = true;
    };

    struct State {
        std::unordered_map<std::string, std::vector<Entry>> listeners;
        SubscriptionId nextId = 1;
        int emitDepth = 0;
    };

public:
    class SubscriptionHandle {
    public:
        SubscriptionHandle() = default;
        SubscriptionHandle(const SubscriptionHandle&) = delete;
        SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;
        SubscriptionHandle(SubscriptionHandle&& other) noexcept;
        SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;
        ~SubscriptionHandle() = default;

        bool IsValid() const { return m_id != 0 && !m_state.expired(); }
        explicit operator bool() const { return IsValid(); }
        SubscriptionId Id() const { return m_id; }
        const std::string& EventName() const { return m_eventName; }
        // Unsubscribes. Safe to call after the emitter is gone.
        void Reset();

    private:
        friend class EventEmitter;
        SubscriptionHandle(std::weak_ptr<State> state, std::string eventName, SubscriptionId id);

        std::weak_ptr<State> m_state;
        std::string m_eventName;
        SubscriptionId m_id = 0;
    };

    class ScopedSubscription {
    public:
        ScopedSubscription() = default;
        explicit ScopedSubscription(SubscriptionHandle handle);
        ScopedSubscription(const ScopedSubscription&) = delete;
        ScopedSubscription& operator=(const ScopedSubscription&) = delete;
        ScopedSubscription(ScopedSubscription&& other) noexcept = default;
        ScopedSubscription& operator=(ScopedSubscription&& other) noexcept;
        ~ScopedSubscription();

        bool IsValid() const { return m_handle.IsValid(); }
        explicit operator bool() const { return IsValid(); }
        void Reset();

    private:
        SubscriptionHandle m_handle;
    };

    EventEmitter();
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    SubscriptionHandle Subscribe(const std::string& eventName, Callback callback);
    // Listener removed after its first invocation.
    SubscriptionHandle SubscribeOnce(const std::string& eventName, Callback callback);

    void Emit(const std::string& eventName, const std::any& payload = {});

    void Unsubscribe(SubscriptionHandle& handle);
    void RemoveAllListeners(const std::string& eventName);
    void RemoveAllListeners();

    std::size_t ListenerCount(const std::string& eventName) const;

private:
    SubscriptionHandle AddListener(const std::string& eventName, Callback callback, bool once);
    static void Deactivate(State& state, const std::string& eventName, SubscriptionId id);
    static void Compact(State& state, const std::string& eventName);

    std::shared_ptr<State> m_state;
};

}} // namespace bonk::core
