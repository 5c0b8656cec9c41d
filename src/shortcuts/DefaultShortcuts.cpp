#include "waypoint/shortcuts/DefaultShortcuts.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"
#include "waypoint/shortcuts/ConfigLocator.hpp"

#include <array>
#include <format>
#include <string>
#include <system_error>

namespace waypoint::shortcuts {
namespace {

#ifdef _WIN32
constexpr std::string_view kDownloadsKey = "{374DE290-123F-4565-9164-39C4925E467B}";
constexpr std::string_view kPicturesKey = "My Pictures";
constexpr std::string_view kMusicKey = "My Music";
constexpr std::string_view kVideosKey = "My Video";
#else
constexpr std::string_view kDownloadsKey = "XDG_DOWNLOAD_DIR";
constexpr std::string_view kPicturesKey = "XDG_PICTURES_DIR";
constexpr std::string_view kMusicKey = "XDG_MUSIC_DIR";
constexpr std::string_view kVideosKey = "XDG_VIDEOS_DIR";
#endif

constexpr std::array<FolderCandidate, 7> kUserFolders = {{
    {"Downloads", kDownloadsKey, "Downloads"},
    {"Documents", kDocumentsFolderKey, "Documents"},
    {"Pictures", kPicturesKey, "Pictures"},
    {"Music", kMusicKey, "Music"},
    {"Videos", kVideosKey, "Videos"},
    {"Scripts", std::nullopt, "Scripts"},
    {"Projects", std::nullopt, "Projects"},
}};

std::filesystem::path tempDirectory() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return {};
    }
    return temp;
}

}  // namespace

std::span<const FolderCandidate> userFolderCandidates() {
    return kUserFolders;
}

std::vector<StaticCandidate> systemFolderCandidates(const std::filesystem::path& home) {
    std::vector<StaticCandidate> candidates;
    candidates.push_back({"Home", home});

#ifdef _WIN32
    const auto env = [](const char* name) -> std::filesystem::path {
        const auto value = common::environmentValue(name);
        return value.has_value() ? std::filesystem::path(*value) : std::filesystem::path();
    };
    const auto systemRoot = env("SystemRoot");
    const auto systemDrive = env("SystemDrive");
    const auto programs32 = env("ProgramFiles(x86)");

    if (!systemRoot.empty()) {
        candidates.push_back({"System", systemRoot / "System32"});
    }
    candidates.push_back({"Programs", env("ProgramFiles")});
    candidates.push_back({"Programs32", programs32});
    candidates.push_back({"ProgramData", env("ProgramData")});
    if (!programs32.empty()) {
        candidates.push_back({"Steam", programs32 / "Steam" / "steamapps" / "common"});
    }
    candidates.push_back({"Temp", tempDirectory()});
    if (!systemDrive.empty()) {
        const auto root = std::filesystem::path(systemDrive.string() + "\\");
        candidates.push_back({"CTemp", root / "Temp"});
        candidates.push_back({"Root", root});
    }
#else
    candidates.push_back({"System", "/usr/bin"});
    candidates.push_back({"Programs", "/opt"});
    candidates.push_back({"Steam", home / ".local" / "share" / "Steam" / "steamapps" / "common"});
    candidates.push_back({"Temp", tempDirectory()});
    candidates.push_back({"Root", "/"});
#endif

    return candidates;
}

ShortcutMap generateDefaultShortcuts(const SpecialFolderResolver& resolver,
                                     std::span<const FolderCandidate> folders,
                                     std::span<const StaticCandidate> statics) {
    ShortcutMap shortcuts;

    const auto consider = [&shortcuts](std::string_view name, const std::filesystem::path& path) {
        if (!common::pathExists(path)) {
            common::Logger::log(std::format("Skipping default shortcut '{}': '{}' does not exist", name,
                                            path.string()));
            return;
        }
        shortcuts.insert_or_assign(std::string(name), path.string());
    };

    for (const auto& folder : folders) {
        consider(folder.name, resolver.resolve(folder.indirectionKey, folder.fallbackRelative));
    }
    for (const auto& candidate : statics) {
        consider(candidate.name, candidate.path);
    }
    return shortcuts;
}

ShortcutMap generateDefaultShortcuts(const SpecialFolderResolver& resolver) {
    const auto statics = systemFolderCandidates(resolver.home());
    return generateDefaultShortcuts(resolver, userFolderCandidates(), statics);
}

}  // namespace waypoint::shortcuts
