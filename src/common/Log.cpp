#include "waypoint/common/Log.hpp"

#include <iostream>

namespace waypoint::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
}

void logWarning(std::string_view message) {
    std::cerr << "[warning] " << message << '\n';
}

void logError(std::string_view message) {
    std::cerr << "[error] " << message << '\n';
}

}  // namespace waypoint::common
