#include "waypoint/common/Paths.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace waypoint::common {
namespace {

bool isVariableChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

#ifdef _WIN32
std::string expandWithWindowsApi(std::string_view text) {
    const std::wstring wide = pathFromUtf8(text).wstring();
    const DWORD required = ExpandEnvironmentStringsW(wide.c_str(), nullptr, 0);
    if (required == 0) {
        return std::string(text);
    }
    std::wstring expanded(required, L'\0');
    const DWORD written = ExpandEnvironmentStringsW(wide.c_str(), expanded.data(), required);
    if (written == 0 || written > required) {
        return std::string(text);
    }
    expanded.resize(written - 1);
    return pathToUtf8(std::filesystem::path(expanded));
}
#endif

/// Expands POSIX-style $VAR and ${VAR} references.
std::string expandDollarReferences(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            out.push_back(text[i++]);
            continue;
        }

        if (text[i + 1] == '{') {
            const size_t close = text.find('}', i + 2);
            if (close == std::string_view::npos) {
                out.append(text.substr(i));
                break;
            }
            const std::string name(text.substr(i + 2, close - i - 2));
            if (const auto value = environmentValue(name); value.has_value()) {
                out += *value;
            } else {
                out.append(text.substr(i, close - i + 1));
            }
            i = close + 1;
            continue;
        }

        size_t end = i + 1;
        while (end < text.size() && isVariableChar(text[end])) {
            ++end;
        }
        if (end == i + 1) {
            out.push_back(text[i++]);
            continue;
        }
        const std::string name(text.substr(i + 1, end - i - 1));
        if (const auto value = environmentValue(name); value.has_value()) {
            out += *value;
        } else {
            out.append(text.substr(i, end - i));
        }
        i = end;
    }
    return out;
}

#ifndef _WIN32
/// Expands Windows-style %VAR% references.
std::string expandPercentReferences(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '%') {
            out.push_back(text[i++]);
            continue;
        }
        const size_t close = text.find('%', i + 1);
        if (close == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        const std::string name(text.substr(i + 1, close - i - 1));
        if (name.empty()) {
            out.push_back('%');
            i = close;
            continue;
        }
        if (const auto value = environmentValue(name); value.has_value()) {
            out += *value;
            i = close + 1;
        } else {
            // Leave the opening '%' in place; the closing one may start another reference.
            out.append(text.substr(i, close - i));
            i = close;
        }
    }
    return out;
}
#endif

}  // namespace

std::optional<std::string> environmentValue(const std::string& name) {
    if (const char* value = std::getenv(name.c_str()); value != nullptr && value[0] != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

std::expected<std::filesystem::path, std::string> homeDirectory() {
#ifdef _WIN32
    constexpr const char* kHomeVariable = "USERPROFILE";
#else
    constexpr const char* kHomeVariable = "HOME";
#endif
    const auto home = environmentValue(kHomeVariable);
    if (!home.has_value()) {
        return std::unexpected(std::string("Cannot determine the home directory: $") + kHomeVariable + " is not set");
    }

    std::filesystem::path path(*home);
    if (!path.is_absolute()) {
        return std::unexpected("Home directory '" + *home + "' is not an absolute path");
    }
    return path;
}

std::string expandEnvironmentReferences(std::string_view text) {
#ifdef _WIN32
    return expandDollarReferences(expandWithWindowsApi(text));
#else
    return expandDollarReferences(expandPercentReferences(text));
#endif
}

std::filesystem::path pathFromUtf8(std::string_view text) {
#ifdef _WIN32
    return std::filesystem::path(std::u8string(text.begin(), text.end()));
#else
    return std::filesystem::path(std::string(text));
#endif
}

std::string pathToUtf8(const std::filesystem::path& path) {
#ifdef _WIN32
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
#else
    return path.string();
#endif
}

bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t codePoint = 0;
        if (lead < 0x80u) {
            ++i;
            continue;
        } else if ((lead & 0xE0u) == 0xC0u) {
            length = 2;
            codePoint = lead & 0x1Fu;
        } else if ((lead & 0xF0u) == 0xE0u) {
            length = 3;
            codePoint = lead & 0x0Fu;
        } else if ((lead & 0xF8u) == 0xF0u) {
            length = 4;
            codePoint = lead & 0x07u;
        } else {
            return false;
        }
        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0u) != 0x80u) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3Fu);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((length == 2 && codePoint < 0x80u) || (length == 3 && codePoint < 0x800u) ||
            (length == 4 && codePoint < 0x10000u) || (codePoint >= 0xD800u && codePoint <= 0xDFFFu) ||
            codePoint > 0x10FFFFu) {
            return false;
        }
        i += length;
    }
    return true;
}

bool pathExists(const std::filesystem::path& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

std::filesystem::path configPathOverride() {
    if (const auto value = environmentValue("WAYPOINT_CONFIG"); value.has_value()) {
        return std::filesystem::path(*value);
    }
    return {};
}

std::filesystem::path debugLogPath() {
    if (const auto value = environmentValue("WAYPOINT_LOG"); value.has_value()) {
        return std::filesystem::path(*value);
    }
    return {};
}

}  // namespace waypoint::common
