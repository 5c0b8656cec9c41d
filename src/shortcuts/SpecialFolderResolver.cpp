#include "waypoint/shortcuts/SpecialFolderResolver.hpp"

#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"

#include <exception>
#include <format>
#include <utility>

namespace waypoint::shortcuts {

SpecialFolderResolver::SpecialFolderResolver(std::filesystem::path home, const FolderIndirection& indirection)
    : home_(std::move(home)), indirection_(indirection) {}

std::filesystem::path SpecialFolderResolver::resolve(std::optional<std::string_view> indirectionKey,
                                                     const std::filesystem::path& fallbackRelative) const {
    if (indirectionKey.has_value()) {
        if (auto redirected = lookupRedirected(*indirectionKey); redirected.has_value()) {
            return *redirected;
        }
    }
    return home_ / fallbackRelative;
}

std::optional<std::filesystem::path> SpecialFolderResolver::lookupRedirected(std::string_view key) const {
    try {
        const auto raw = indirection_.lookup(key);
        if (!raw.has_value() || raw->empty()) {
            return std::nullopt;
        }

        const auto expanded = common::expandEnvironmentReferences(*raw);
        auto candidate = common::pathFromUtf8(expanded);
        if (!candidate.is_absolute() || !common::pathExists(candidate)) {
            common::Logger::log(std::format(
                "Ignoring folder value for '{}': '{}' is not an existing absolute path", key, expanded));
            return std::nullopt;
        }
        return candidate;
    } catch (const std::exception& ex) {
        common::Logger::logWarning(std::format("Folder lookup for '{}' failed: {}", key, ex.what()));
        return std::nullopt;
    }
}

}  // namespace waypoint::shortcuts
