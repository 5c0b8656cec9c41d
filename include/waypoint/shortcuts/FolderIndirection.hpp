#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace waypoint::shortcuts {

/// OS-level key/value store that records where special folders really live.
/// Values are returned raw; environment references are expanded by the caller.
class FolderIndirection {
public:
    virtual ~FolderIndirection() = default;
    virtual std::optional<std::string> lookup(std::string_view key) const = 0;
};

class NullFolderIndirection final : public FolderIndirection {
public:
    std::optional<std::string> lookup(std::string_view key) const override;
};

/// Reads the XDG user-dirs.dirs file (XDG_DOCUMENTS_DIR="$HOME/Documents" lines).
/// A missing or unreadable file behaves like an empty store.
class XdgUserDirsIndirection final : public FolderIndirection {
public:
    explicit XdgUserDirsIndirection(const std::filesystem::path& userDirsFile);

    std::optional<std::string> lookup(std::string_view key) const override;

    /// $XDG_CONFIG_HOME/user-dirs.dirs, falling back to <home>/.config/user-dirs.dirs.
    static std::filesystem::path defaultFile(const std::filesystem::path& home);

private:
    std::unordered_map<std::string, std::string> entries_;
};

#ifdef _WIN32
/// HKCU\Software\Microsoft\Windows\CurrentVersion\Explorer\User Shell Folders.
class RegistryFolderIndirection final : public FolderIndirection {
public:
    std::optional<std::string> lookup(std::string_view key) const override;
};
#endif

std::unique_ptr<FolderIndirection> makeSystemFolderIndirection(const std::filesystem::path& home);

}  // namespace waypoint::shortcuts
