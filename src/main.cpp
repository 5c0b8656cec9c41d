#include "waypoint/common/Log.hpp"
#include "waypoint/common/Logger.hpp"
#include "waypoint/common/Paths.hpp"
#include "waypoint/shortcuts/ConfigLocator.hpp"
#include "waypoint/shortcuts/DefaultShortcuts.hpp"
#include "waypoint/shortcuts/FolderIndirection.hpp"
#include "waypoint/shortcuts/ShortcutService.hpp"
#include "waypoint/shortcuts/ShortcutStore.hpp"
#include "waypoint/shortcuts/SpecialFolderResolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::cli {
namespace {

using shortcuts::ShortcutError;

enum class Command : uint8_t {
    List,
    Go,
    Add,
    Edit,
    Remove,
    Reset,
    ConfigPath,
    Help,
};

struct CliOptions {
    Command command = Command::Help;
    std::vector<std::string> arguments;
    bool assumeYes = false;
    bool passthrough = false;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " <command> [arguments]\n";
    out << "\nCommands:\n";
    out << "  list                 Show all shortcuts\n";
    out << "  go <name>            Print the directory a shortcut points to\n";
    out << "  add <name> <path>    Create a shortcut (relative paths use the current directory)\n";
    out << "  edit <name> <path>   Point an existing shortcut somewhere else\n";
    out << "  remove <name>        Delete a shortcut\n";
    out << "  reset [--yes] [--passthru]\n";
    out << "                       Replace all shortcuts with the defaults for this machine\n";
    out << "  config-path          Print the location of the shortcut file\n";
    out << "\nShell integration: wp() { cd \"$(" << programName << " go \"$1\")\"; }\n";
}

std::expected<CliOptions, std::string> parseArgs(int argc, char** argv) {
    CliOptions options;
    if (argc < 2) {
        return options;
    }

    const std::string_view command = argv[1];
    size_t expectedArguments = 0;
    if (command == "list") {
        options.command = Command::List;
    } else if (command == "go") {
        options.command = Command::Go;
        expectedArguments = 1;
    } else if (command == "add") {
        options.command = Command::Add;
        expectedArguments = 2;
    } else if (command == "edit") {
        options.command = Command::Edit;
        expectedArguments = 2;
    } else if (command == "remove") {
        options.command = Command::Remove;
        expectedArguments = 1;
    } else if (command == "reset") {
        options.command = Command::Reset;
    } else if (command == "config-path") {
        options.command = Command::ConfigPath;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        return std::unexpected(std::format("Unknown command '{}'", command));
    }

    for (int i = 2; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (options.command == Command::Reset && (arg == "--yes" || arg == "-y")) {
            options.assumeYes = true;
            continue;
        }
        if (options.command == Command::Reset && arg == "--passthru") {
            options.passthrough = true;
            continue;
        }
        options.arguments.emplace_back(arg);
    }

    if (options.arguments.size() != expectedArguments) {
        return std::unexpected(std::format("'{}' expects {} argument(s), got {}", command, expectedArguments,
                                           options.arguments.size()));
    }
    return options;
}

void printShortcuts(const shortcuts::ShortcutMap& map) {
    if (map.empty()) {
        common::logInfo("No shortcuts defined");
        return;
    }
    size_t width = 0;
    for (const auto& entry : map) {
        width = std::max(width, entry.first.size());
    }
    for (const auto& name : shortcuts::sortedShortcutNames(map)) {
        std::cout << std::format("{:<{}}  {}\n", name, width, map.at(name));
    }
}

bool confirmOverwrite(const std::filesystem::path& configPath) {
    std::cout << std::format("Replace all shortcuts in '{}' with the defaults? [y/N] ", configPath.string());
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return !answer.empty() && std::tolower(static_cast<unsigned char>(answer.front())) == 'y';
}

/// Surfaces a failed operation; 1 for errors, 2 for warnings (nothing changed).
int reportFailure(const ShortcutError& error) {
    if (shortcuts::severityOf(error.code) == shortcuts::DiagnosticSeverity::Error) {
        common::logError(error.message);
        common::Logger::logError(error.message);
        return 1;
    }
    common::logWarning(error.message);
    common::Logger::logWarning(error.message);
    return 2;
}

int run(const CliOptions& options, std::string_view programName) {
    if (options.command == Command::Help) {
        printUsage(std::cout, programName);
        return 0;
    }

    const auto home = common::homeDirectory();
    if (!home.has_value()) {
        common::logError(home.error());
        return 1;
    }

    const auto indirection = shortcuts::makeSystemFolderIndirection(*home);
    const shortcuts::SpecialFolderResolver resolver(*home, *indirection);
    const auto sink = shortcuts::consoleDiagnosticSink();

    shortcuts::ShortcutStore store([&resolver, &sink]() { return shortcuts::configFilePath(resolver, sink); },
                                   [&resolver]() { return shortcuts::generateDefaultShortcuts(resolver); }, sink);
    shortcuts::ShortcutService service(store);

    switch (options.command) {
    case Command::List:
        printShortcuts(service.getShortcuts());
        return 0;
    case Command::Go: {
        auto target = service.navigateTo(options.arguments[0]);
        if (!target.has_value()) {
            return reportFailure(target.error());
        }
        std::cout << target->string() << '\n';
        return 0;
    }
    case Command::Add: {
        auto added = service.addShortcut(options.arguments[0], options.arguments[1]);
        return added.has_value() ? 0 : reportFailure(added.error());
    }
    case Command::Edit: {
        auto edited = service.editShortcut(options.arguments[0], options.arguments[1]);
        return edited.has_value() ? 0 : reportFailure(edited.error());
    }
    case Command::Remove: {
        auto removed = service.removeShortcut(options.arguments[0]);
        return removed.has_value() ? 0 : reportFailure(removed.error());
    }
    case Command::Reset: {
        const auto configPath = service.configPath();
        if (!options.assumeYes && common::pathExists(configPath) && !confirmOverwrite(configPath)) {
            common::logInfo("Shortcuts left unchanged");
            return 0;
        }
        auto created = service.createDefaults(options.passthrough);
        if (!created.has_value()) {
            return reportFailure(created.error());
        }
        if (options.passthrough) {
            printShortcuts(*created);
        }
        return 0;
    }
    case Command::ConfigPath:
        std::cout << service.configPath().string() << '\n';
        return 0;
    case Command::Help:
        break;
    }
    return 0;
}

}  // namespace
}  // namespace waypoint::cli

int main(int argc, char** argv) {
    const std::string_view programName = argc > 0 ? argv[0] : "waypoint";
    auto options = waypoint::cli::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        waypoint::cli::printUsage(std::cerr, programName);
        return 1;
    }

    waypoint::common::Logger::init(waypoint::common::debugLogPath());
    int status = 1;
    try {
        status = waypoint::cli::run(*options, programName);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
    }
    waypoint::common::Logger::shutdown();
    return status;
}
