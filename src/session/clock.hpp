#pragma once

#include <chrono>

// Time source for the polling loops. Tests substitute a fake that advances
// virtual time on sleep_for() instead of blocking.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

// Shared process-wide SteadyClock
Clock& system_clock();
