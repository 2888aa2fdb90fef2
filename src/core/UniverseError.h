#pragma once

#include <string>

namespace Convida {

struct UniverseError {
    std::string message;

    UniverseError() : message("Unknown error") {}
    explicit UniverseError(const std::string& msg) : message(msg) {}
    UniverseError(const char* msg) : message(msg) {}
};

} // namespace Convida
