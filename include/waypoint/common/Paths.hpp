#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace waypoint::common {

/// Returns the value of an environment variable, or nullopt when it is unset or empty.
std::optional<std::string> environmentValue(const std::string& name);

/// Resolves the user's home directory.
/// On Windows: %USERPROFILE%. Elsewhere: $HOME.
/// This is the only environment lookup whose failure is fatal for waypoint.
std::expected<std::filesystem::path, std::string> homeDirectory();

/// Expands %VAR%, $VAR and ${VAR} references using the process environment.
/// References to unset variables are left untouched.
std::string expandEnvironmentReferences(std::string_view text);

/// Builds a path from UTF-8 text. On Windows this avoids the ANSI code page.
std::filesystem::path pathFromUtf8(std::string_view text);

/// UTF-8 spelling of a path. On Windows this avoids the ANSI code page, which throws
/// for characters it cannot represent.
std::string pathToUtf8(const std::filesystem::path& path);

bool isValidUtf8(std::string_view text);

/// Returns true if something exists at the given path. Never throws.
bool pathExists(const std::filesystem::path& path);

/// Resolves the optional shortcut file override ($WAYPOINT_CONFIG).
/// Returns an empty path when no override is set.
std::filesystem::path configPathOverride();

/// Resolves the optional debug log file ($WAYPOINT_LOG).
/// Returns an empty path when file logging is disabled.
std::filesystem::path debugLogPath();

}  // namespace waypoint::common
