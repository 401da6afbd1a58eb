#pragma once
#include <chrono>
#include <functional>
#include <thread>

// Time sources are injected so the cache and retry paths can be driven
// deterministically from tests.
using SteadyClockFn = std::function<std::chrono::steady_clock::time_point()>;
using SleepFn       = std::function<void(std::chrono::milliseconds)>;

inline std::chrono::steady_clock::time_point steady_now() {
    return std::chrono::steady_clock::now();
}

inline void real_sleep(std::chrono::milliseconds d) {
    if (d.count() > 0) {
        std::this_thread::sleep_for(d);
    }
}
