#include "waypoint/shortcuts/ConfigLocator.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"

#include <format>
#include <system_error>

namespace waypoint::shortcuts {
namespace {

constexpr std::string_view kCloudFolderName = "OneDrive";
constexpr std::string_view kConfigDirName = "PowerShell";
constexpr std::string_view kConfigFileName = "LocationShortcuts.json";

bool isSeparator(char c) {
    return c == '\\' || c == '/';
}

void ensureParentDirectory(const std::filesystem::path& file, const DiagnosticSink& sink) {
    const auto dir = file.parent_path();
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        const auto message = std::format("Could not create configuration directory '{}': {}", dir.string(),
                                         ec.message());
        if (sink) {
            sink(Diagnostic{DiagnosticSeverity::Warning, ShortcutErrorCode::ConfigDirCreateFailed, message});
        } else {
            common::Logger::logWarning(message);
        }
    }
}

}  // namespace

bool isCloudRedirected(std::string_view path) {
    size_t pos = path.find(kCloudFolderName);
    while (pos != std::string_view::npos) {
        const bool precededBySeparator = pos > 0 && isSeparator(path[pos - 1]);
        const size_t end = pos + kCloudFolderName.size();
        if (precededBySeparator) {
            if (end == path.size()) {
                return true;
            }
            if (isSeparator(path[end])) {
                return true;
            }
            if (path.substr(end).starts_with(" - ")) {
                return true;
            }
        }
        pos = path.find(kCloudFolderName, pos + 1);
    }
    return false;
}

std::filesystem::path configBaseDirectory(const SpecialFolderResolver& resolver) {
    const auto fallback = resolver.home() / "Documents";
    const auto documents = resolver.resolve(kDocumentsFolderKey, "Documents");
    if (isCloudRedirected(documents.string())) {
        return documents;
    }
    return fallback;
}

std::filesystem::path configFilePath(const SpecialFolderResolver& resolver, const DiagnosticSink& sink) {
    std::filesystem::path file = common::configPathOverride();
    if (file.empty()) {
        file = configBaseDirectory(resolver) / kConfigDirName / kConfigFileName;
    }
    ensureParentDirectory(file, sink);
    return file;
}

}  // namespace waypoint::shortcuts
