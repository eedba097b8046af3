#include "bonk/core/Time.hpp"

#include "bonk/core/Logger.hpp"

#include <cmath>

namespace bonk {
namespace core {

Time::Time(float fixedDeltaTime, float timeScale) {
    SetFixedDeltaTime(fixedDeltaTime);
    SetTimeScale(timeScale);
}

void Time::Update(float unscaledDeltaTime) {
    if (!std::isfinite(unscaledDeltaTime) || unscaledDeltaTime < 0.0f) {
        Logger::Warning("[Time] Ignoring invalid frame delta {}", unscaledDeltaTime);
        unscaledDeltaTime = 0.0f;
    }
    m_unscaledDeltaTime = unscaledDeltaTime;
    m_deltaTime = unscaledDeltaTime * m_timeScale;
    m_time += m_deltaTime;
    m_unscaledTime += unscaledDeltaTime;
    ++m_frameCount;
}

void Time::UpdateFromClock() {
    const auto now = Clock::now();
    float delta = 0.0f;
    if (m_lastClockSample) {
        delta = std::chrono::duration<float>(now - *m_lastClockSample).count();
    }
    m_lastClockSample = now;
    Update(delta);
}

void Time::Reset() {
    m_time = 0.0;
    m_unscaledTime = 0.0;
    m_deltaTime = 0.0f;
    m_unscaledDeltaTime = 0.0f;
    m_frameCount = 0;
    m_lastClockSample.reset();
}

void Time::SetTimeScale(float scale) {
    if (!std::isfinite(scale) || scale < 0.0f) {
        Logger::Warning("[Time] Time scale {} is invalid, clamping to 0", scale);
        scale = 0.0f;
    }
    m_timeScale = scale;
}

void Time::SetFixedDeltaTime(float fixedDeltaTime) {
    if (!std::isfinite(fixedDeltaTime) || fixedDeltaTime <= 0.0f) {
        Logger::Warning("[Time] Fixed delta time {} is invalid, keeping {}", fixedDeltaTime, m_fixedDeltaTime);
        return;
    }
    m_fixedDeltaTime = fixedDeltaTime;
}

}} // namespace bonk::core
