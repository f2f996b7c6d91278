#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/guard_errors.hpp"

namespace hookguard::app::cli {

    enum class Command {
        Check,   // hook mode: payload on stdin
        Status,
        Set,
        Log,
        Help
    };

    struct CliOptions {
        Command command = Command::Check;
        std::optional<std::filesystem::path> config_path;
        std::string setting_key;
        std::string setting_value;
        std::uint32_t tail = 20;
        bool verbose = false;
    };

    hookguard::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
