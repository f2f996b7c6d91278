#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace hookguard::app::cli {

    using namespace hookguard::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> command;
        std::vector<std::string> positionals;
        std::optional<std::string> config;
        std::optional<std::string> tail;
        bool verbose = false;
        bool help = false;
    };

    std::string usage() {
        return "Usage:\n"
               "  hookguard [--config PATH] [--verbose] [check]   evaluate a hook payload from stdin\n"
               "  hookguard [--config PATH] status                 show settings, rules and recent activity\n"
               "  hookguard [--config PATH] set <key> <value>      key: mode | logging | log_file\n"
               "  hookguard [--config PATH] log [--tail N]         print the last N audit records\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return GuardError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--tail") {
                if (i + 1 < args.size()) raw.tail = args[++i];
                else return GuardError{ErrorCategory::Input, "Missing value for --tail", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else if (args[i].rfind("--", 0) == 0) {
                return GuardError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else if (!raw.command.has_value()) {
                raw.command = args[i];
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions opts;
        opts.verbose = raw.verbose;
        if (raw.config) {
            if (raw.config->empty()) {
                return GuardError{ErrorCategory::Input, "--config cannot be empty", "invalid_path"};
            }
            opts.config_path = std::filesystem::path(raw.config.value());
        }

        if (raw.help) {
            opts.command = Command::Help;
            return opts;
        }

        const std::string command = raw.command.value_or("check");
        if (command == "check") {
            opts.command = Command::Check;
        } else if (command == "status") {
            opts.command = Command::Status;
        } else if (command == "set") {
            opts.command = Command::Set;
        } else if (command == "log") {
            opts.command = Command::Log;
        } else {
            return GuardError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                              "Commands: check, status, set, log."};
        }

        if (opts.command == Command::Set) {
            if (raw.positionals.size() != 2) {
                return GuardError{ErrorCategory::Input, "set expects <key> <value>", "missing_value",
                                  "Example: hookguard set mode whitelist"};
            }
            opts.setting_key = raw.positionals[0];
            opts.setting_value = raw.positionals[1];
        } else if (!raw.positionals.empty()) {
            return GuardError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals.front(),
                              "unknown_argument"};
        }

        if (raw.tail) {
            if (opts.command != Command::Log) {
                return GuardError{ErrorCategory::Input, "--tail only applies to the log command", "conflicting_flags"};
            }
            // Exception-free integer parsing
            uint32_t lines = 0;
            const char* begin = raw.tail->data();
            const char* end = raw.tail->data() + raw.tail->size();
            auto [ptr, ec] = std::from_chars(begin, end, lines);
            if (ec != std::errc() || ptr != end) {
                return GuardError{ErrorCategory::Input, "Invalid number for --tail", "invalid_integer", "Provide a positive integer."};
            }
            if (lines == 0 || lines > 10000) {
                return GuardError{ErrorCategory::Input, "--tail out of bounds", "bounds_error", "Must be between 1 and 10000."};
            }
            opts.tail = lines;
        }

        return opts;
    }

} // namespace hookguard::app::cli
