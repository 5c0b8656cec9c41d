#pragma once

#include <filesystem>
#include <string>

namespace waypoint::common {

/// Simple logger that writes diagnostic information to a debug log file.
/// Nothing is written unless init() was given a usable path (normally $WAYPOINT_LOG).
class Logger {
public:
    static void init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace waypoint::common
