#include "waypoint/shortcuts/ShortcutError.hpp"

#include "waypoint/common/Log.hpp"
#include "waypoint/common/Logger.hpp"

#include <format>

namespace waypoint::shortcuts {

std::string_view toString(ShortcutErrorCode code) {
    switch (code) {
    case ShortcutErrorCode::IndirectionLookupFailed:
        return "IndirectionLookupFailed";
    case ShortcutErrorCode::ConfigDirCreateFailed:
        return "ConfigDirCreateFailed";
    case ShortcutErrorCode::ConfigUnreadable:
        return "ConfigUnreadable";
    case ShortcutErrorCode::ConfigMalformed:
        return "ConfigMalformed";
    case ShortcutErrorCode::ConfigWriteError:
        return "ConfigWriteError";
    case ShortcutErrorCode::DuplicateName:
        return "DuplicateName";
    case ShortcutErrorCode::UnknownName:
        return "UnknownName";
    case ShortcutErrorCode::InvalidName:
        return "InvalidName";
    case ShortcutErrorCode::InvalidPath:
        return "InvalidPath";
    case ShortcutErrorCode::TargetMissing:
        return "TargetMissing";
    }
    return "Unknown";
}

DiagnosticSeverity severityOf(ShortcutErrorCode code) {
    switch (code) {
    case ShortcutErrorCode::ConfigUnreadable:
    case ShortcutErrorCode::ConfigMalformed:
    case ShortcutErrorCode::ConfigWriteError:
    case ShortcutErrorCode::InvalidName:
    case ShortcutErrorCode::InvalidPath:
        return DiagnosticSeverity::Error;
    default:
        return DiagnosticSeverity::Warning;
    }
}

DiagnosticSink consoleDiagnosticSink() {
    return [](const Diagnostic& diagnostic) {
        const auto line = std::format("{} ({})", diagnostic.message, toString(diagnostic.code));
        if (diagnostic.severity == DiagnosticSeverity::Error) {
            common::logError(diagnostic.message);
            common::Logger::logError(line);
        } else {
            common::logWarning(diagnostic.message);
            common::Logger::logWarning(line);
        }
    };
}

}  // namespace waypoint::shortcuts
