#include "bonk/scene/Scheduler.hpp"

#include "bonk/core/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace bonk::scene {

bool CoroutineHandle::IsRunning() const {
    return m_state && !m_state->finished && !m_state->cancelled;
}

bool CoroutineHandle::IsCancelled() const {
    return m_state && m_state->cancelled;
}

void CoroutineHandle::Cancel() {
    if (!m_state || m_state->finished) {
        return;
    }
    m_state->cancelled = true;
}

YieldInstruction YieldInstruction::WaitSeconds(float seconds) {
    YieldInstruction instruction;
    instruction.m_type = Type::WaitSeconds;
    instruction.m_seconds = std::isfinite(seconds) ? std::max(0.0f, seconds) : 0.0f;
    return instruction;
}

YieldInstruction YieldInstruction::WaitFrames(int frames) {
    YieldInstruction instruction;
    instruction.m_type = Type::WaitFrames;
    instruction.m_frames = std::max(0, frames);
    return instruction;
}

YieldInstruction YieldInstruction::WaitUntil(std::function<bool()> predicate) {
    YieldInstruction instruction;
    instruction.m_type = Type::WaitUntil;
    instruction.m_predicate = std::move(predicate);
    return instruction;
}

YieldInstruction YieldInstruction::WaitForCoroutine(const CoroutineHandle& handle) {
    YieldInstruction instruction;
    instruction.m_type = Type::WaitForCoroutine;
    instruction.m_awaited = handle.m_state;
    return instruction;
}

YieldInstruction YieldInstruction::Finish() {
    YieldInstruction instruction;
    instruction.m_type = Type::Finish;
    return instruction;
}

CoroutineSequence& CoroutineSequence::Then(std::function<void()> action) {
    if (action) {
        m_steps.push_back(Step{ std::move(action), YieldInstruction() });
    }
    return *this;
}

CoroutineSequence& CoroutineSequence::Wait(YieldInstruction instruction) {
    m_steps.push_back(Step{ nullptr, std::move(instruction) });
    return *this;
}

CoroutineSequence& CoroutineSequence::Loop(bool loop) {
    m_loop = loop;
    return *this;
}

Coroutine CoroutineSequence::Build() const {
    auto steps = std::make_shared<const std::vector<Step>>(m_steps);
    const bool loop = m_loop;
    const bool hasWait = std::any_of(m_steps.begin(), m_steps.end(),
                                     [](const Step& step) { return !step.action; });

    return [steps, loop, hasWait, index = std::size_t{0}]() mutable -> YieldInstruction {
        while (true) {
            if (index >= steps->size()) {
                if (!loop || steps->empty()) {
                    return YieldInstruction::Finish();
                }
                index = 0;
                // A loop without waits still gives up the frame between passes.
                if (!hasWait) {
                    return YieldInstruction::NextFrame();
                }
            }
            const Step& step = (*steps)[index++];
            if (!step.action) {
                return step.wait;
            }
            step.action();
        }
    };
}

CoroutineHandle Scheduler::Start(Coroutine coroutine) {
    auto state = std::make_shared<detail::CoroutineState>();
    if (!coroutine) {
        state->finished = true;
        return CoroutineHandle(state);
    }
    state->body = std::move(coroutine);
    if (m_updating) {
        m_started.push_back(state);
    } else {
        m_active.push_back(state);
    }
    return CoroutineHandle(state);
}

bool Scheduler::Stop(const CoroutineHandle& handle) {
    if (!handle.IsRunning()) {
        return false;
    }
    auto owns = [&handle](const std::shared_ptr<detail::CoroutineState>& state) {
        return state == handle.m_state;
    };
    if (std::none_of(m_active.begin(), m_active.end(), owns) &&
        std::none_of(m_started.begin(), m_started.end(), owns)) {
        return false;
    }
    handle.m_state->cancelled = true;
    return true;
}

void Scheduler::StopAll() {
    for (auto& state : m_active) {
        if (!state->finished) {
            state->cancelled = true;
        }
    }
    for (auto& state : m_started) {
        state->cancelled = true;
    }
    if (!m_updating) {
        m_active.clear();
        m_started.clear();
    }
}

void Scheduler::Update(float deltaTime) {
    if (m_updating) {
        core::Logger::Warning("[Scheduler] Re-entrant Update ignored");
        return;
    }

    m_updating = true;
    const std::size_t count = m_active.size();
    for (std::size_t i = 0; i < count; ++i) {
        detail::CoroutineState& state = *m_active[i];
        if (state.finished || state.cancelled) {
            continue;
        }
        try {
            if (IsReady(state, deltaTime)) {
                Resume(state);
            }
        } catch (const std::exception& ex) {
            state.finished = true;
            state.body = nullptr;
            ReportFault(ex);
        }
    }
    m_updating = false;

    m_active.erase(std::remove_if(m_active.begin(), m_active.end(),
                                  [](const auto& state) { return state->finished || state->cancelled; }),
                   m_active.end());
    for (auto& state : m_started) {
        if (!state->cancelled) {
            m_active.push_back(std::move(state));
        }
    }
    m_started.clear();
}

std::size_t Scheduler::GetActiveCount() const {
    auto running = [](const auto& state) { return !state->finished && !state->cancelled; };
    return static_cast<std::size_t>(std::count_if(m_active.begin(), m_active.end(), running)) +
           static_cast<std::size_t>(std::count_if(m_started.begin(), m_started.end(), running));
}

bool Scheduler::IsReady(detail::CoroutineState& state, float deltaTime) {
    YieldInstruction& pending = state.pending;
    switch (pending.m_type) {
        case YieldInstruction::Type::NextFrame:
        case YieldInstruction::Type::Finish:
            return true;
        case YieldInstruction::Type::WaitSeconds:
            state.elapsed += deltaTime;
            return state.elapsed >= pending.m_seconds;
        case YieldInstruction::Type::WaitFrames:
            ++state.frames;
            return state.frames >= pending.m_frames;
        case YieldInstruction::Type::WaitUntil:
            return !pending.m_predicate || pending.m_predicate();
        case YieldInstruction::Type::WaitForCoroutine: {
            const auto& awaited = pending.m_awaited;
            return !awaited || awaited->finished || awaited->cancelled;
        }
    }
    return true;
}

void Scheduler::Resume(detail::CoroutineState& state) {
    state.pending = YieldInstruction::NextFrame();
    state.elapsed = 0.0f;
    state.frames = 0;

    YieldInstruction next = state.body();
    if (state.cancelled) {
        state.body = nullptr;
        return;
    }
    if (next.m_type == YieldInstruction::Type::Finish) {
        state.finished = true;
        state.body = nullptr;
        return;
    }
    state.pending = std::move(next);
}

void Scheduler::ReportFault(const std::exception& ex) const {
    if (m_faultHandler) {
        m_faultHandler(ex);
        return;
    }
    core::Logger::Error("[Scheduler] Coroutine threw and was stopped: {}", ex.what());
}

} // namespace bonk::scene
