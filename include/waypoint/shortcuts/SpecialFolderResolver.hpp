#pragma once

#include "waypoint/shortcuts/FolderIndirection.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace waypoint::shortcuts {

/// Resolves special user folders (Documents, Downloads, ...) through the OS indirection
/// store, degrading to <home>/<fallback> whenever the store cannot give a usable answer.
class SpecialFolderResolver {
public:
    SpecialFolderResolver(std::filesystem::path home, const FolderIndirection& indirection);

    /// Accepts an indirection value only if, after environment expansion, it is an
    /// absolute path that exists. Never fails; a failed lookup yields home / fallbackRelative.
    std::filesystem::path resolve(std::optional<std::string_view> indirectionKey,
                                  const std::filesystem::path& fallbackRelative) const;

    const std::filesystem::path& home() const { return home_; }

private:
    std::optional<std::filesystem::path> lookupRedirected(std::string_view key) const;

    std::filesystem::path home_;
    const FolderIndirection& indirection_;
};

}  // namespace waypoint::shortcuts
