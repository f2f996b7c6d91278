#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include "app/cli_parser.hpp"
#include "app/request_adapter.hpp"
#include "app/status_view.hpp"
#include "core/config/config_paths.hpp"
#include "core/errors/guard_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/rule_store.hpp"

namespace {

constexpr int kCommandFailedExit = 1;

std::filesystem::path executable_dir(const char* argv0) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec && argv0 != nullptr) {
        self = std::filesystem::absolute(argv0, ec);
    }
    if (ec) {
        return {};
    }
    return self.parent_path();
}

void configure_logging(bool verbose) {
    auto& logger = hookguard::core::logging::Logger::get();
    if (const char* level = std::getenv(hookguard::core::config::kLogLevelEnvVar)) {
        if (auto parsed = hookguard::core::logging::parse_level(level)) {
            logger.set_min_level(*parsed);
        }
    }
    if (verbose) {
        logger.set_min_level(hookguard::core::logging::LogLevel::DEBUG);
    }
}

void print_error(const hookguard::core::errors::GuardError& err) {
    LOG_ERROR(err.message + " [" + err.code + "]");
    if (!err.hint.empty()) {
        LOG_WARN("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using hookguard::app::cli::Command;
    namespace errors = hookguard::core::errors;

    auto parsed = hookguard::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        std::cerr << "[hookguard] " << err.message << "\n" << hookguard::app::cli::usage();
        if (!err.hint.empty()) {
            std::cerr << "Hint: " << err.hint << "\n";
        }
        // A misconfigured hook registration must still not let the tool through.
        return hookguard::app::to_exit_code(hookguard::app::ExitStatus::Block);
    }
    const auto& opts = errors::get_value(parsed);
    configure_logging(opts.verbose);

    const auto config_path = hookguard::core::config::resolve_config_path(
        opts.config_path, executable_dir(argc > 0 ? argv[0] : nullptr));
    LOG_DEBUG("Using configuration: " + config_path.string());

    switch (opts.command) {
        case Command::Help:
            std::cout << hookguard::app::cli::usage();
            return 0;

        case Command::Check: {
            const std::string payload((std::istreambuf_iterator<char>(std::cin)),
                                      std::istreambuf_iterator<char>());
            hookguard::app::RequestAdapter adapter(config_path);
            return hookguard::app::to_exit_code(adapter.handle(payload, std::cerr));
        }

        case Command::Status: {
            hookguard::app::StatusView view(config_path);
            auto rendered = view.render();
            if (errors::is_error(rendered)) {
                print_error(errors::get_error(rendered));
                return kCommandFailedExit;
            }
            std::cout << errors::get_value(rendered);
            return 0;
        }

        case Command::Set: {
            auto written = hookguard::policy::RuleStore::update_setting(
                config_path, opts.setting_key, opts.setting_value);
            if (errors::is_error(written)) {
                print_error(errors::get_error(written));
                return kCommandFailedExit;
            }
            std::cout << opts.setting_key << " = " << opts.setting_value << " ("
                      << errors::get_value(written).string() << ")\n";
            return 0;
        }

        case Command::Log: {
            hookguard::app::StatusView view(config_path);
            auto records = view.recent_records(opts.tail);
            if (errors::is_error(records)) {
                print_error(errors::get_error(records));
                return kCommandFailedExit;
            }
            for (const auto& line : errors::get_value(records)) {
                std::cout << line << "\n";
            }
            return 0;
        }
    }

    return kCommandFailedExit;
}
