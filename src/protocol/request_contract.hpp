#pragma once
#include <string>
#include <variant>

namespace hookguard::protocol {

    enum class AccessMode {
        Read,
        Write
    };

    // A shell command proposed by the agent.
    struct CommandRequest {
        std::string command_text;
    };

    // A file the agent wants to touch. The path is taken as given by the host.
    struct AccessRequest {
        std::string path;
        AccessMode mode = AccessMode::Write;
    };

    // Built fresh per tool call, never reused.
    using Request = std::variant<CommandRequest, AccessRequest>;

    inline std::string to_string(AccessMode mode) {
        return mode == AccessMode::Read ? "read" : "write";
    }

    // Kind label used in the audit log.
    inline std::string request_kind(const Request& request) {
        if (const auto* access = std::get_if<AccessRequest>(&request)) {
            return access->mode == AccessMode::Read ? "READ" : "WRITE";
        }
        return "COMMAND";
    }

    inline const std::string& request_subject(const Request& request) {
        if (const auto* access = std::get_if<AccessRequest>(&request)) {
            return access->path;
        }
        return std::get<CommandRequest>(request).command_text;
    }

} // namespace hookguard::protocol
