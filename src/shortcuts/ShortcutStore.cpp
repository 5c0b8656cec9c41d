#include "waypoint/shortcuts/ShortcutStore.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace waypoint::shortcuts {
namespace {

std::unexpected<ShortcutError> malformed(std::string message) {
    return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigMalformed, std::move(message)});
}

std::expected<std::string, ShortcutError> readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigUnreadable,
                                             std::format("Failed to open '{}'", common::pathToUtf8(path))});
    }
    std::string text(std::istreambuf_iterator<char>(file), {});
    if (file.bad()) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigUnreadable,
                                             std::format("Failed while reading '{}'", common::pathToUtf8(path))});
    }
    return text;
}

std::expected<void, ShortcutError> writeTextFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigWriteError,
                                             std::format("Failed to open '{}' for writing", common::pathToUtf8(path))});
    }
    file << text;
    file.flush();
    if (!file.good()) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigWriteError,
                                             std::format("Failed while writing '{}'", common::pathToUtf8(path))});
    }
    return {};
}

}  // namespace

std::expected<ShortcutMap, ShortcutError> parseShortcutDocument(const std::string& text,
                                                                std::vector<std::string>* skippedNames) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        return malformed(std::format("Shortcut file is not valid JSON: {}", ex.what()));
    }

    if (!root.is_object()) {
        return malformed(std::format("Shortcut file must contain a JSON object, found {}", root.type_name()));
    }

    ShortcutMap shortcuts;
    for (const auto& item : root.items()) {
        const std::string& name = item.key();
        const json& value = item.value();
        if (!value.is_string()) {
            return malformed(std::format("Shortcut '{}' must map to a path string, found {}", name, value.type_name()));
        }
        if (!isValidShortcutName(name)) {
            if (skippedNames != nullptr) {
                skippedNames->push_back(name);
            }
            continue;
        }
        if (const auto existing = findShortcut(shortcuts, name); existing.has_value()) {
            return malformed(std::format("Shortcut names '{}' and '{}' differ only by case", *existing, name));
        }
        shortcuts.emplace(name, value.get<std::string>());
    }
    return shortcuts;
}

std::expected<std::string, ShortcutError> serializeShortcutDocument(const ShortcutMap& shortcuts) {
    json root = json::object();
    for (const auto& [name, path] : shortcuts) {
        root[name] = path;
    }
    try {
        return root.dump(2);
    } catch (const json::type_error& ex) {
        return std::unexpected(ShortcutError{ShortcutErrorCode::ConfigWriteError,
                                             std::format("Shortcuts cannot be stored as JSON: {}", ex.what())});
    }
}

ShortcutStore::ShortcutStore(PathProvider configPath, DefaultsGenerator defaults, DiagnosticSink sink)
    : configPath_(std::move(configPath)), defaults_(std::move(defaults)), sink_(std::move(sink)) {}

ShortcutMap ShortcutStore::load() {
    auto loaded = loadForUpdate();
    if (!loaded.has_value()) {
        report(loaded.error());
        return {};
    }
    return std::move(*loaded);
}

std::expected<ShortcutMap, ShortcutError> ShortcutStore::loadForUpdate() {
    const auto path = configPath_();

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (!ec && !exists) {
        return createMissingFile(path);
    }

    auto text = readTextFile(path);
    if (!text.has_value()) {
        return std::unexpected(text.error());
    }

    std::vector<std::string> skipped;
    auto parsed = parseShortcutDocument(*text, &skipped);
    if (!parsed.has_value()) {
        return std::unexpected(ShortcutError{parsed.error().code,
                                             std::format("Could not load shortcuts from '{}': {}",
                                                         common::pathToUtf8(path), parsed.error().message)});
    }

    for (const auto& name : skipped) {
        report(ShortcutError{ShortcutErrorCode::InvalidName,
                             std::format("Ignoring shortcut '{}' in '{}': not a valid shortcut name", name,
                                         common::pathToUtf8(path))},
               DiagnosticSeverity::Warning);
    }
    return std::move(*parsed);
}

std::expected<void, ShortcutError> ShortcutStore::save(const ShortcutMap& shortcuts) {
    const auto path = configPath_();
    auto document = serializeShortcutDocument(shortcuts);
    if (!document.has_value()) {
        return std::unexpected(document.error());
    }
    auto written = writeTextFile(path, *document);
    if (written.has_value()) {
        common::Logger::log(
            std::format("Saved {} shortcut(s) to '{}'", shortcuts.size(), common::pathToUtf8(path)));
    }
    return written;
}

std::expected<ShortcutMap, ShortcutError> ShortcutStore::resetToDefaults() {
    ShortcutMap shortcuts = defaults_ ? defaults_() : ShortcutMap{};
    if (auto saved = save(shortcuts); !saved.has_value()) {
        return std::unexpected(saved.error());
    }
    return shortcuts;
}

ShortcutMap ShortcutStore::createMissingFile(const std::filesystem::path& path) {
    common::Logger::log(std::format("No shortcut file at '{}', creating defaults", common::pathToUtf8(path)));
    ShortcutMap shortcuts = defaults_ ? defaults_() : ShortcutMap{};
    if (auto saved = save(shortcuts); !saved.has_value()) {
        report(saved.error());
    }
    return shortcuts;
}

void ShortcutStore::report(const ShortcutError& error) const {
    report(error, severityOf(error.code));
}

void ShortcutStore::report(const ShortcutError& error, DiagnosticSeverity severity) const {
    if (sink_) {
        sink_(Diagnostic{severity, error.code, error.message});
    } else {
        common::Logger::logError(error.message);
    }
}

}  // namespace waypoint::shortcuts
