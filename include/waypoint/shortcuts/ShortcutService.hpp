#pragma once

#include "waypoint/shortcuts/ShortcutError.hpp"
#include "waypoint/shortcuts/ShortcutMap.hpp"
#include "waypoint/shortcuts/ShortcutStore.hpp"

#include <expected>
#include <filesystem>
#include <string_view>

namespace waypoint::shortcuts {

/// Makes a user-supplied path absolute (relative to the current directory) and normalizes it.
/// Fails with InvalidPath when nothing exists there.
std::expected<std::filesystem::path, ShortcutError> resolveTargetPath(const std::filesystem::path& path);

/// Operations used by the command-line layer. Each mutation loads the current file,
/// applies the change and saves it before returning; failures leave the file untouched.
class ShortcutService {
public:
    explicit ShortcutService(ShortcutStore& store);

    ShortcutMap getShortcuts();

    /// Replaces the stored shortcuts with the generated defaults. The new map is returned
    /// only when passthrough is set.
    std::expected<ShortcutMap, ShortcutError> createDefaults(bool passthrough);

    std::expected<void, ShortcutError> addShortcut(std::string_view name, const std::filesystem::path& path);
    std::expected<void, ShortcutError> editShortcut(std::string_view name, const std::filesystem::path& newPath);
    std::expected<void, ShortcutError> removeShortcut(std::string_view name);

    /// Target directory of a shortcut, checked to still exist.
    std::expected<std::filesystem::path, ShortcutError> navigateTo(std::string_view name);

    std::filesystem::path configPath() const { return store_.configPath(); }

private:
    std::expected<void, ShortcutError> persist(const ShortcutMap& shortcuts);

    ShortcutStore& store_;
};

}  // namespace waypoint::shortcuts
