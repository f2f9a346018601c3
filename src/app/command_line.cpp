/// @file command_line.cpp
/// @brief Console command line parsing implementation

#include "command_line.hpp"

#include <format>

#include "core/util/string_utils.hpp"

namespace verinfo::app {

namespace {

// Selecting a second command is an error ("--env PATH --registry X")
std::expected<void, std::string> setCommand(Options& options, Command command,
                                            std::string_view flag) {
    if (options.command != Command::Report && options.command != command) {
        return std::unexpected(std::format("{} cannot be combined with another query", flag));
    }
    options.command = command;
    return {};
}

}  // namespace

std::optional<Section> sectionFromString(std::string_view str) noexcept {
    if (equalsIcase(str, "all"))
        return Section::All;
    if (equalsIcase(str, "os"))
        return Section::OperatingSystem;
    if (equalsIcase(str, "hardware"))
        return Section::Hardware;
    if (equalsIcase(str, "environment"))
        return Section::Environment;
    return std::nullopt;
}

std::expected<Options, std::string> parseCommandLine(const std::vector<std::string>& args) {
    Options options;

    // Fetch the value following a flag
    size_t i = 0;
    auto next_value = [&](std::string_view flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= args.size() || args[i + 1].starts_with("--")) {
            return std::unexpected(std::format("{} requires a value", flag));
        }
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h" || arg == "/?") {
            options.command = Command::Help;
            return options;
        }

        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--config") {
            auto value = next_value(arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config_path = utf8ToPath(*value);
        } else if (arg == "--lang") {
            auto value = next_value(arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.language = *value;
        } else if (arg == "--section") {
            auto value = next_value(arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto section = sectionFromString(*value);
            if (!section) {
                return std::unexpected(std::format("Unknown section: {}", *value));
            }
            options.section = *section;
        } else if (arg == "--languages") {
            auto result = setCommand(options, Command::Languages, arg);
            if (!result) {
                return std::unexpected(result.error());
            }
        } else if (arg == "--compare") {
            auto result = setCommand(options, Command::Compare, arg);
            if (!result) {
                return std::unexpected(result.error());
            }
            // Optional culture
            if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
                options.argument = args[++i];
            }
        } else if (arg == "--registry" || arg == "--env" || arg == "--folder") {
            Command command = arg == "--registry" ? Command::Registry
                              : arg == "--env"    ? Command::Env
                                                  : Command::Folder;
            auto result = setCommand(options, command, arg);
            if (!result) {
                return std::unexpected(result.error());
            }
            auto value = next_value(arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.argument = *value;
        } else if (arg == "--cim") {
            auto result = setCommand(options, Command::Cim, arg);
            if (!result) {
                return std::unexpected(result.error());
            }
            auto cls = next_value(arg);
            if (!cls) {
                return std::unexpected(cls.error());
            }
            auto property = next_value(arg);
            if (!property) {
                return std::unexpected(property.error());
            }
            options.cim_class = *cls;
            options.argument = *property;
        } else {
            return std::unexpected(std::format("Unknown option: {}", arg));
        }
    }

    return options;
}

std::string usageText() {
    return "Usage: verinfo [options]\n"
           "\n"
           "Report:\n"
           "  --section <all|os|hardware|environment>  Sections to print (default all)\n"
           "  --languages                              Translation coverage per culture\n"
           "  --compare [culture]                      Compare string table keys with the\n"
           "                                           default culture\n"
           "\n"
           "Single queries:\n"
           "  --registry <value>                       Value under HKLM\\Software\\Microsoft\\\n"
           "                                           Windows NT\\CurrentVersion\n"
           "  --cim <os|sys|proc> <property>           Property of Win32_OperatingSystem,\n"
           "                                           Win32_ComputerSystem or Win32_Processor\n"
           "  --env <name>                             Environment variable\n"
           "  --folder <name>                          Special folder (Desktop, Documents,\n"
           "                                           AppData, LocalAppData, ProgramData,\n"
           "                                           ProgramFiles, ProgramFilesX86, System,\n"
           "                                           Windows, UserProfile, Temp, Startup, Fonts)\n"
           "\n"
           "General:\n"
           "  --config <path>                          Settings file\n"
           "  --lang <culture>                         UI culture (e.g. de-DE)\n"
           "  --verbose, -v                            Debug logging to the console\n"
           "  --help, -h                               Show this text\n";
}

}  // namespace verinfo::app
