#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace bonk {
namespace core {

/**
 * @brief Frame clock owned by a Scene.
 *
 * `Update` is called once per rendered frame with the real elapsed time.
 * `DeltaTime` is that value multiplied by the time scale. `FixedDeltaTime`
 * is never scaled; the scene decides how many fixed steps a frame runs.
 */
class Time {
public:
    static constexpr float kDefaultFixedDeltaTime = 1.0f / 60.0f;

    Time() = default;
    explicit Time(float fixedDeltaTime, float timeScale = 1.0f);

    void Update(float unscaledDeltaTime);
    // Measures the wall-clock delta since the previous call. The first call reports zero.
    void UpdateFromClock();
    void Reset();

    float DeltaTime() const { return m_deltaTime; }
    float UnscaledDeltaTime() const { return m_unscaledDeltaTime; }
    float FixedDeltaTime() const { return m_fixedDeltaTime; }
    float TimeScale() const { return m_timeScale; }
    double TotalTime() const { return m_time; }
    double UnscaledTotalTime() const { return m_unscaledTime; }
    std::uint64_t FrameCount() const { return m_frameCount; }

    void SetTimeScale(float scale);
    void SetFixedDeltaTime(float fixedDeltaTime);

private:
    using Clock = std::chrono::steady_clock;

    double m_time = 0.0;
    double m_unscaledTime = 0.0;
    float m_deltaTime = 0.0f;
    float m_unscaledDeltaTime = 0.0f;
    float m_fixedDeltaTime = kDefaultFixedDeltaTime;
    float m_timeScale = 1.0f;
    std::uint64_t m_frameCount = 0;
    std::optional<Clock::time_point> m_lastClockSample;
};

}} // namespace bonk::core
