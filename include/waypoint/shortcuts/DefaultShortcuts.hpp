#pragma once

#include "waypoint/shortcuts/ShortcutMap.hpp"
#include "waypoint/shortcuts/SpecialFolderResolver.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace waypoint::shortcuts {

/// A user folder found through the indirection store, or at <home>/<fallback>.
struct FolderCandidate {
    std::string_view name;
    std::optional<std::string_view> indirectionKey;
    std::string_view fallbackRelative;
};

/// A folder whose location comes straight from the environment.
struct StaticCandidate {
    std::string name;
    std::filesystem::path path;
};

/// Downloads, Documents, Pictures, Music, Videos, Scripts, Projects.
std::span<const FolderCandidate> userFolderCandidates();

/// Home, System, Programs, Programs32, ProgramData, Steam, Temp, CTemp, Root.
/// Entries the platform has no equivalent for are left out.
std::vector<StaticCandidate> systemFolderCandidates(const std::filesystem::path& home);

/// Resolves every candidate and keeps the ones whose path exists right now.
ShortcutMap generateDefaultShortcuts(const SpecialFolderResolver& resolver,
                                     std::span<const FolderCandidate> folders,
                                     std::span<const StaticCandidate> statics);

ShortcutMap generateDefaultShortcuts(const SpecialFolderResolver& resolver);

}  // namespace waypoint::shortcuts
