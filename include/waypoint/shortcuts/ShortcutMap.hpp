#pragma once

#include "waypoint/shortcuts/ShortcutError.hpp"

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::shortcuts {

/// ASCII case-insensitive ordering used for shortcut names.
struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

/// Shortcut name -> absolute path. Lookups ignore case; keys keep the casing they were added with.
using ShortcutMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/// True when the name matches [A-Za-z0-9_-]+.
bool isValidShortcutName(std::string_view name);

/// InvalidName error reported for a name that fails isValidShortcutName.
ShortcutError invalidNameError(std::string_view name);

/// Returns the stored casing of a name, or nullopt when no shortcut matches.
std::optional<std::string> findShortcut(const ShortcutMap& shortcuts, std::string_view name);

// The following mutate the map only; callers persist with ShortcutStore::save.
std::expected<void, ShortcutError> addShortcut(ShortcutMap& shortcuts, std::string_view name, std::string path);
std::expected<void, ShortcutError> editShortcut(ShortcutMap& shortcuts, std::string_view name, std::string newPath);
std::expected<void, ShortcutError> removeShortcut(ShortcutMap& shortcuts, std::string_view name);

std::vector<std::string> sortedShortcutNames(const ShortcutMap& shortcuts);

}  // namespace waypoint::shortcuts
