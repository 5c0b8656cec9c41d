#pragma once

#include "waypoint/shortcuts/ShortcutError.hpp"
#include "waypoint/shortcuts/ShortcutMap.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace waypoint::shortcuts {

/// Parses the persisted document: a flat JSON object of name -> path strings.
/// Keys that only differ by case and non-string values are ConfigMalformed.
/// Keys that are not valid shortcut names are dropped and listed in skippedNames.
std::expected<ShortcutMap, ShortcutError> parseShortcutDocument(const std::string& text,
                                                                std::vector<std::string>* skippedNames = nullptr);

/// Fails with ConfigWriteError when a name or path is not valid UTF-8.
std::expected<std::string, ShortcutError> serializeShortcutDocument(const ShortcutMap& shortcuts);

/// Owns loading and saving of the shortcut file. The file location is asked for on every
/// load/save, since redirection may change between invocations.
///
/// No locking is done between processes: two invocations that load, modify and save
/// concurrently race, and the later save wins.
class ShortcutStore {
public:
    using PathProvider = std::function<std::filesystem::path()>;
    using DefaultsGenerator = std::function<ShortcutMap()>;

    ShortcutStore(PathProvider configPath, DefaultsGenerator defaults, DiagnosticSink sink);

    /// Never fails. A missing file is replaced by freshly generated defaults (which are saved);
    /// an unreadable or malformed file is reported through the sink, left untouched, and an
    /// empty map is returned.
    ShortcutMap load();

    /// Like load(), but an unreadable or malformed file is returned as the error so that the
    /// caller does not save over it. A failure to save generated defaults is only reported.
    std::expected<ShortcutMap, ShortcutError> loadForUpdate();

    /// Overwrites the file with the given map.
    std::expected<void, ShortcutError> save(const ShortcutMap& shortcuts);

    /// Generates the default set and saves it, replacing whatever was stored.
    std::expected<ShortcutMap, ShortcutError> resetToDefaults();

    std::filesystem::path configPath() const { return configPath_(); }

private:
    ShortcutMap createMissingFile(const std::filesystem::path& path);

    void report(const ShortcutError& error) const;
    void report(const ShortcutError& error, DiagnosticSeverity severity) const;

    PathProvider configPath_;
    DefaultsGenerator defaults_;
    DiagnosticSink sink_;
};

}  // namespace waypoint::shortcuts
