#pragma once

#include <string_view>

namespace waypoint::common {

// User-facing console channel.
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

}  // namespace waypoint::common
