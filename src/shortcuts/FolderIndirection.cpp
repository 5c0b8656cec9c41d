#include "waypoint/shortcuts/FolderIndirection.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"

#include <format>
#include <fstream>
#include <string>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace waypoint::shortcuts {
namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string unquote(std::string_view value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

}  // namespace

std::optional<std::string> NullFolderIndirection::lookup(std::string_view) const {
    return std::nullopt;
}

XdgUserDirsIndirection::XdgUserDirsIndirection(const std::filesystem::path& userDirsFile) {
    std::ifstream file(userDirsFile);
    if (!file) {
        common::Logger::log(std::format("No user-dirs file at '{}'", userDirsFile.string()));
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        const auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        const size_t eq = trimmed.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto key = trim(trimmed.substr(0, eq));
        const auto value = unquote(trim(trimmed.substr(eq + 1)));
        if (!key.empty() && !value.empty()) {
            entries_.insert_or_assign(std::string(key), value);
        }
    }
}

std::optional<std::string> XdgUserDirsIndirection::lookup(std::string_view key) const {
    const auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::filesystem::path XdgUserDirsIndirection::defaultFile(const std::filesystem::path& home) {
    if (const auto xdg = common::environmentValue("XDG_CONFIG_HOME"); xdg.has_value()) {
        return std::filesystem::path(*xdg) / "user-dirs.dirs";
    }
    return home / ".config" / "user-dirs.dirs";
}

#ifdef _WIN32
std::optional<std::string> RegistryFolderIndirection::lookup(std::string_view key) const {
    constexpr const wchar_t* kUserShellFolders = L"Software\\Microsoft\\Windows\\CurrentVersion\\Explorer\\User Shell Folders";
    const std::wstring valueName = common::pathFromUtf8(key).wstring();

    // RRF_NOEXPAND keeps %USERPROFILE% references; expansion happens in the resolver.
    constexpr DWORD kFlags = RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ | RRF_NOEXPAND;
    DWORD size = 0;
    if (RegGetValueW(HKEY_CURRENT_USER, kUserShellFolders, valueName.c_str(), kFlags, nullptr, nullptr, &size) !=
            ERROR_SUCCESS ||
        size == 0) {
        return std::nullopt;
    }

    std::wstring buffer(size / sizeof(wchar_t), L'\0');
    if (RegGetValueW(HKEY_CURRENT_USER, kUserShellFolders, valueName.c_str(), kFlags, nullptr, buffer.data(),
                     &size) != ERROR_SUCCESS) {
        return std::nullopt;
    }
    buffer.resize(wcsnlen(buffer.c_str(), buffer.size()));
    if (buffer.empty()) {
        return std::nullopt;
    }
    return common::pathToUtf8(std::filesystem::path(buffer));
}
#endif

std::unique_ptr<FolderIndirection> makeSystemFolderIndirection(const std::filesystem::path& home) {
#ifdef _WIN32
    (void)home;
    return std::make_unique<RegistryFolderIndirection>();
#else
    return std::make_unique<XdgUserDirsIndirection>(XdgUserDirsIndirection::defaultFile(home));
#endif
}

}  // namespace waypoint::shortcuts
