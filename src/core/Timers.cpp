#include "Timers.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace Convida {

namespace {

double millisecondsSince(std::chrono::steady_clock::time_point start)
{
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return elapsed.count() / 1000.0;
}

} // namespace

void Timers::startTimer(const std::string& name)
{
    auto& timer = timers[name];
    if (!timer.isRunning) {
        timer.startTime = std::chrono::steady_clock::now();
        timer.isRunning = true;
        timer.callCount++;
    }
}

double Timers::stopTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    auto& timer = it->second;
    if (timer.isRunning) {
        timer.accumulatedTime += millisecondsSince(timer.startTime);
        timer.isRunning = false;
    }
    return timer.accumulatedTime;
}

bool Timers::hasTimer(const std::string& name) const
{
    return timers.find(name) != timers.end();
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    const auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }
    return timer.accumulatedTime + millisecondsSince(timer.startTime);
}

void Timers::resetTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it != timers.end()) {
        it->second.accumulatedTime = 0.0;
        if (it->second.isRunning) {
            it->second.startTime = std::chrono::steady_clock::now();
        }
    }
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    auto it = timers.find(name);
    return it == timers.end() ? 0 : it->second.callCount;
}

void Timers::resetCallCount(const std::string& name)
{
    auto it = timers.find(name);
    if (it != timers.end()) {
        it->second.callCount = 0;
    }
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(timers.size());
    for (const auto& pair : timers) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();

    for (const auto& [name, timerData] : timers) {
        double total_ms = getAccumulatedTime(name);
        uint32_t calls = timerData.callCount;
        double avg_ms = calls > 0 ? total_ms / calls : 0.0;

        j[name] = { { "total_ms", total_ms }, { "avg_ms", avg_ms }, { "calls", calls } };
    }

    return j;
}

} // namespace Convida
