#pragma once

#include "bonk/scene/Behavior.hpp"

#include <string>

namespace bonk::demo {

// Logs landings and hops the crate a moment after each one.
class CrateHopper : public Behavior {
public:
    void Start() override;
    void OnCollisionEnter(GameObject& other, const ContactInfo& contact) override;
    void OnTriggerEnter(GameObject& other) override;

    int GetLandingCount() const { return m_landings; }

private:
    int m_landings = 0;
    bool m_hopQueued = false;
};

// Reports its owner's world position at a fixed interval.
class PositionReporter : public Behavior {
public:
    explicit PositionReporter(float intervalSeconds = 0.25f) : m_interval(intervalSeconds) {}

    void Start() override;

private:
    float m_interval;
};

// Removes its owner after a delay.
class Fuse : public Behavior {
public:
    explicit Fuse(float seconds = 1.0f) : m_seconds(seconds) {}

    void Start() override;
    void OnDestroy() override;

private:
    float m_seconds;
};

} // namespace bonk::demo
