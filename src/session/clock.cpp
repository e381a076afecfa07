#include "clock.hpp"
#include <thread>

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) std::this_thread::sleep_for(duration);
}

Clock& system_clock() {
    static SteadyClock clock;
    return clock;
}
