#include "waypoint/shortcuts/ShortcutMap.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace waypoint::shortcuts {
namespace {

char foldAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::unexpected<ShortcutError> unknownName(std::string_view name) {
    return std::unexpected(
        ShortcutError{ShortcutErrorCode::UnknownName, std::format("No shortcut named '{}' exists", name)});
}

}  // namespace

bool CaseInsensitiveLess::operator()(std::string_view lhs, std::string_view rhs) const {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                        [](char a, char b) { return foldAscii(a) < foldAscii(b); });
}

bool isValidShortcutName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    });
}

ShortcutError invalidNameError(std::string_view name) {
    return ShortcutError{ShortcutErrorCode::InvalidName,
                         std::format("'{}' is not a valid shortcut name (use letters, digits, '_' and '-')", name)};
}

std::optional<std::string> findShortcut(const ShortcutMap& shortcuts, std::string_view name) {
    const auto it = shortcuts.find(name);
    if (it == shortcuts.end()) {
        return std::nullopt;
    }
    return it->first;
}

std::expected<void, ShortcutError> addShortcut(ShortcutMap& shortcuts, std::string_view name, std::string path) {
    if (!isValidShortcutName(name)) {
        return std::unexpected(invalidNameError(name));
    }
    if (const auto existing = findShortcut(shortcuts, name); existing.has_value()) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::DuplicateName,
                                             std::format("A shortcut named '{}' already exists", *existing)});
    }
    shortcuts.emplace(std::string(name), std::move(path));
    return {};
}

std::expected<void, ShortcutError> editShortcut(ShortcutMap& shortcuts, std::string_view name, std::string newPath) {
    const auto it = shortcuts.find(name);
    if (it == shortcuts.end()) {
        return unknownName(name);
    }
    it->second = std::move(newPath);
    return {};
}

std::expected<void, ShortcutError> removeShortcut(ShortcutMap& shortcuts, std::string_view name) {
    const auto it = shortcuts.find(name);
    if (it == shortcuts.end()) {
        return unknownName(name);
    }
    shortcuts.erase(it);
    return {};
}

std::vector<std::string> sortedShortcutNames(const ShortcutMap& shortcuts) {
    std::vector<std::string> names;
    names.reserve(shortcuts.size());
    for (const auto& entry : shortcuts) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace waypoint::shortcuts
