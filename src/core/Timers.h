#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Convida {

/**
 * Named accumulating stopwatches for phase timing.
 */
class Timers {
public:
    Timers() = default;
    ~Timers() = default;

    // Start a timer with the given name. Starting a running timer is a no-op.
    void startTimer(const std::string& name);

    // Stop a timer and return its accumulated time in milliseconds (-1 if unknown).
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Total accumulated time in milliseconds, including a running session (-1 if unknown).
    double getAccumulatedTime(const std::string& name) const;

    void resetTimer(const std::string& name);

    // Number of times the timer has been started.
    uint32_t getCallCount(const std::string& name) const;

    void resetCallCount(const std::string& name);

    std::vector<std::string> getAllTimerNames() const;

    // { "<name>": { "total_ms": ..., "avg_ms": ..., "calls": ... }, ... }
    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers;
};

} // namespace Convida
