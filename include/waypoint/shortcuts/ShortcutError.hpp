#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace waypoint::shortcuts {

enum class ShortcutErrorCode : uint8_t {
    IndirectionLookupFailed,
    ConfigDirCreateFailed,
    ConfigUnreadable,
    ConfigMalformed,
    ConfigWriteError,
    DuplicateName,
    UnknownName,
    InvalidName,
    InvalidPath,
    TargetMissing,
};

struct ShortcutError {
    ShortcutErrorCode code = ShortcutErrorCode::ConfigMalformed;
    std::string message;
};

enum class DiagnosticSeverity : uint8_t {
    Warning,
    Error,
};

/// A non-fatal condition surfaced to the user instead of being returned to the caller.
struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Warning;
    ShortcutErrorCode code = ShortcutErrorCode::ConfigMalformed;
    std::string message;
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

std::string_view toString(ShortcutErrorCode code);

/// Severity the user-facing layer reports an error code with.
DiagnosticSeverity severityOf(ShortcutErrorCode code);

/// Writes diagnostics to the console channel and mirrors them into the debug log.
DiagnosticSink consoleDiagnosticSink();

}  // namespace waypoint::shortcuts
