#include "waypoint/shortcuts/ShortcutService.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"

#include <format>
#include <system_error>

namespace waypoint::shortcuts {
namespace {

std::unexpected<ShortcutError> invalidPath(const std::filesystem::path& path, std::string_view reason) {
    return std::unexpected(
        ShortcutError{ShortcutErrorCode::InvalidPath, std::format("Path '{}' {}", common::pathToUtf8(path), reason)});
}

}  // namespace

std::expected<std::filesystem::path, ShortcutError> resolveTargetPath(const std::filesystem::path& path) {
    if (path.empty()) {
        return invalidPath(path, "is empty");
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return invalidPath(path, std::format("cannot be made absolute: {}", ec.message()));
    }

    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }

    if (!common::pathExists(absolute)) {
        return invalidPath(path, "does not exist");
    }
    // The shortcut file is UTF-8 JSON; a name it cannot hold would not survive a save.
    if (!common::isValidUtf8(common::pathToUtf8(absolute))) {
        return invalidPath(path, "is not valid UTF-8");
    }
    return absolute;
}

ShortcutService::ShortcutService(ShortcutStore& store) : store_(store) {}

ShortcutMap ShortcutService::getShortcuts() {
    return store_.load();
}

std::expected<ShortcutMap, ShortcutError> ShortcutService::createDefaults(bool passthrough) {
    auto created = store_.resetToDefaults();
    if (!created.has_value()) {
        return std::unexpected(created.error());
    }
    if (!passthrough) {
        return ShortcutMap{};
    }
    return std::move(*created);
}

std::expected<void, ShortcutError> ShortcutService::addShortcut(std::string_view name,
                                                                const std::filesystem::path& path) {
    if (!isValidShortcutName(name)) {
        return std::unexpected(invalidNameError(name));
    }
    auto target = resolveTargetPath(path);
    if (!target.has_value()) {
        return std::unexpected(target.error());
    }

    auto loaded = store_.loadForUpdate();
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    auto& stored = *loaded;
    if (auto added = shortcuts::addShortcut(stored, name, common::pathToUtf8(*target)); !added.has_value()) {
        return added;
    }
    common::Logger::log(std::format("Added shortcut '{}' -> '{}'", name, common::pathToUtf8(*target)));
    return persist(stored);
}

std::expected<void, ShortcutError> ShortcutService::editShortcut(std::string_view name,
                                                                 const std::filesystem::path& newPath) {
    auto target = resolveTargetPath(newPath);
    if (!target.has_value()) {
        return std::unexpected(target.error());
    }

    auto loaded = store_.loadForUpdate();
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    auto& stored = *loaded;
    if (auto edited = shortcuts::editShortcut(stored, name, common::pathToUtf8(*target)); !edited.has_value()) {
        return edited;
    }
    common::Logger::log(std::format("Shortcut '{}' now points to '{}'", name, common::pathToUtf8(*target)));
    return persist(stored);
}

std::expected<void, ShortcutError> ShortcutService::removeShortcut(std::string_view name) {
    auto loaded = store_.loadForUpdate();
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    auto& stored = *loaded;
    if (auto removed = shortcuts::removeShortcut(stored, name); !removed.has_value()) {
        return removed;
    }
    common::Logger::log(std::format("Removed shortcut '{}'", name));
    return persist(stored);
}

std::expected<std::filesystem::path, ShortcutError> ShortcutService::navigateTo(std::string_view name) {
    const auto stored = store_.load();
    const auto it = stored.find(name);
    if (it == stored.end()) {
        return std::unexpected(
            ShortcutError{ShortcutErrorCode::UnknownName, std::format("No shortcut named '{}' exists", name)});
    }

    const auto target = common::pathFromUtf8(it->second);
    if (!common::pathExists(target)) {
        return std::unexpected(ShortcutError{
            ShortcutErrorCode::TargetMissing,
            std::format("Shortcut '{}' points to '{}', which no longer exists", it->first, it->second)});
    }
    return target;
}

std::expected<void, ShortcutError> ShortcutService::persist(const ShortcutMap& shortcuts) {
    auto saved = store_.save(shortcuts);
    if (!saved.has_value()) {
        common::Logger::logError(saved.error().message);
    }
    return saved;
}

}  // namespace waypoint::shortcuts
