#pragma once

#include "waypoint/shortcuts/ShortcutError.hpp"
#include "waypoint/shortcuts/SpecialFolderResolver.hpp"

#include <filesystem>
#include <string_view>

namespace waypoint::shortcuts {

#ifdef _WIN32
inline constexpr std::string_view kDocumentsFolderKey = "Personal";
#else
inline constexpr std::string_view kDocumentsFolderKey = "XDG_DOCUMENTS_DIR";
#endif

/// True when the path carries a OneDrive folder segment ("\OneDrive\", "\OneDrive - Org",
/// or a trailing "\OneDrive"). Either separator is accepted.
bool isCloudRedirected(std::string_view path);

/// Documents directory the shortcut file lives under. A redirected Documents folder is only
/// honoured when it points into cloud storage; otherwise <home>/Documents is used.
std::filesystem::path configBaseDirectory(const SpecialFolderResolver& resolver);

/// Computes the shortcut file path and creates its parent directory.
/// $WAYPOINT_CONFIG replaces the computed path when set. A directory that cannot be created
/// is reported through the sink; the path is returned regardless.
std::filesystem::path configFilePath(const SpecialFolderResolver& resolver, const DiagnosticSink& sink);

}  // namespace waypoint::shortcuts
