#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <vector>

namespace bonk::scene {

class YieldInstruction;

// Runs one segment per call and says what to wait for before the next one.
using Coroutine = std::function<YieldInstruction()>;

namespace detail {
struct CoroutineState;
}

/**
 * @brief Shared view of a started coroutine.
 *
 * Copies refer to the same coroutine. A default-constructed handle refers to
 * nothing and reports not running.
 */
class CoroutineHandle {
public:
    CoroutineHandle() = default;

    bool IsValid() const { return m_state != nullptr; }
    bool IsRunning() const;
    bool IsCancelled() const;
    // Idempotent. The coroutine never resumes again.
    void Cancel();

    explicit operator bool() const { return IsRunning(); }
    bool operator==(const CoroutineHandle& other) const { return m_state == other.m_state; }
    bool operator!=(const CoroutineHandle& other) const { return m_state != other.m_state; }

private:
    friend class Scheduler;
    friend class YieldInstruction;

    explicit CoroutineHandle(std::shared_ptr<detail::CoroutineState> state) : m_state(std::move(state)) {}

    std::shared_ptr<detail::CoroutineState> m_state;
};

class YieldInstruction {
public:
    enum class Type {
        NextFrame,
        WaitSeconds,
        WaitFrames,
        WaitUntil,
        WaitForCoroutine,
        Finish
    };

    YieldInstruction() = default;

    static YieldInstruction NextFrame() { return YieldInstruction(); }
    // Scaled seconds, counted from the tick after the yield.
    static YieldInstruction WaitSeconds(float seconds);
    static YieldInstruction WaitFrames(int frames);
    // Polled once per tick.
    static YieldInstruction WaitUntil(std::function<bool()> predicate);
    // Resumes once the other coroutine has finished or been cancelled.
    static YieldInstruction WaitForCoroutine(const CoroutineHandle& handle);
    static YieldInstruction Finish();

    Type GetType() const { return m_type; }
    float GetSeconds() const { return m_seconds; }
    int GetFrames() const { return m_frames; }

private:
    friend class Scheduler;

    Type m_type = Type::NextFrame;
    float m_seconds = 0.0f;
    int m_frames = 0;
    std::function<bool()> m_predicate;
    std::shared_ptr<detail::CoroutineState> m_awaited;
};

namespace detail {
struct CoroutineState {
    Coroutine body;
    YieldInstruction pending;
    float elapsed = 0.0f;
    int frames = 0;
    bool finished = false;
    bool cancelled = false;
};
} // namespace detail

/**
 * @brief Builds a Coroutine from a flat list of actions and waits.
 *
 * @example
 * auto blink = CoroutineSequence()
 *     .Then([&] { sprite.SetVisible(false); })
 *     .WaitSeconds(0.1f)
 *     .Then([&] { sprite.SetVisible(true); })
 *     .WaitSeconds(0.1f)
 *     .Loop()
 *     .Build();
 */
class CoroutineSequence {
public:
    CoroutineSequence& Then(std::function<void()> action);
    CoroutineSequence& Wait(YieldInstruction instruction);
    CoroutineSequence& WaitSeconds(float seconds) { return Wait(YieldInstruction::WaitSeconds(seconds)); }
    CoroutineSequence& WaitFrames(int frames) { return Wait(YieldInstruction::WaitFrames(frames)); }
    CoroutineSequence& WaitUntil(std::function<bool()> predicate) {
        return Wait(YieldInstruction::WaitUntil(std::move(predicate)));
    }
    // Start over after the last step instead of finishing.
    CoroutineSequence& Loop(bool loop = true);

    Coroutine Build() const;

private:
    struct Step {
        std::function<void()> action;
        YieldInstruction wait;
    };

    std::vector<Step> m_steps;
    bool m_loop = false;
};

/**
 * @brief Per-owner cooperative scheduler.
 *
 * Update() resumes each ready coroutine at most once. Coroutines started
 * while Update() is running join on the next call. An exception escaping a
 * segment ends that coroutine only and is passed to the fault handler.
 */
class Scheduler {
public:
    using FaultHandler = std::function<void(const std::exception&)>;

    Scheduler() = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    CoroutineHandle Start(Coroutine coroutine);
    // Returns false if the handle was not running here.
    bool Stop(const CoroutineHandle& handle);
    void StopAll();

    void Update(float deltaTime);

    std::size_t GetActiveCount() const;
    bool IsUpdating() const { return m_updating; }

    void SetFaultHandler(FaultHandler handler) { m_faultHandler = std::move(handler); }

private:
    static bool IsReady(detail::CoroutineState& state, float deltaTime);
    static void Resume(detail::CoroutineState& state);
    void ReportFault(const std::exception& ex) const;

    std::vector<std::shared_ptr<detail::CoroutineState>> m_active;
    std::vector<std::shared_ptr<detail::CoroutineState>> m_started;
    FaultHandler m_faultHandler;
    bool m_updating = false;
};

} // namespace bonk::scene
