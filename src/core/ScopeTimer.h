#pragma once

#include "Timers.h"

#include <string>

namespace Convida {

// Runs a named timer for the lifetime of the object.
class ScopeTimer {
public:
    explicit ScopeTimer(Timers& timers, const std::string& name) : timers_(timers), name_(name)
    {
        timers_.startTimer(name_);
    }

    ~ScopeTimer() { timers_.stopTimer(name_); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& timers_;
    std::string name_;
};

} // namespace Convida
