#include "app/request_adapter.hpp"

#include <array>
#include <exception>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "audit/audit_log.hpp"
#include "core/logging/logger.hpp"
#include "policy/decision_engine.hpp"
#include "policy/path_matcher.hpp"
#include "policy/rule_store.hpp"

namespace hookguard::app {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using nlohmann::json;
using protocol::AccessMode;
using protocol::AccessRequest;
using protocol::CommandRequest;
using protocol::Decision;
using protocol::Verdict;

namespace {

constexpr const char* kMessagePrefix = "[hookguard] ";

constexpr std::array<const char*, 4> kWriteTools = {"Write", "Edit", "MultiEdit",
                                                    "NotebookEdit"};
constexpr std::array<const char*, 1> kReadTools = {"Read"};

// Hosts name the target differently per tool; the first present key wins.
constexpr std::array<const char*, 5> kPathKeys = {"file_path", "notebook_path", "path",
                                                  "target", "file"};

template <std::size_t N>
bool contains(const std::array<const char*, N>& names, const std::string& name) {
    for (const char* candidate : names) {
        if (name == candidate) {
            return true;
        }
    }
    return false;
}

GuardError payload_error(const std::string& message, const std::string& code) {
    return GuardError{ErrorCategory::Payload, message, code};
}

core::errors::Result<std::string> extract_path(const json& tool_input) {
    for (const char* key : kPathKeys) {
        const auto it = tool_input.find(key);
        if (it == tool_input.end() || it->is_null()) {
            continue;
        }
        if (!it->is_string()) {
            return payload_error(std::string("tool_input.") + key + " must be a string.",
                                 "invalid_payload");
        }
        auto value = it->get<std::string>();
        if (!value.empty()) {
            return value;
        }
    }
    return payload_error("tool_input carries no file path.", "missing_path");
}

Verdict fail_closed_verdict() {
    return Verdict{Decision::Block, protocol::kFailClosedReason, std::nullopt};
}

}  // namespace

RequestAdapter::RequestAdapter(std::filesystem::path config_path,
                               std::filesystem::path home)
    : config_path_(std::move(config_path)), home_(std::move(home)) {}

core::errors::Result<ToolCall> RequestAdapter::parse_payload(
    const std::string& raw_payload) {
    const json payload = json::parse(raw_payload, nullptr, false);
    if (payload.is_discarded()) {
        return payload_error("Hook payload is not valid JSON.", "invalid_json");
    }
    if (!payload.is_object()) {
        return payload_error("Hook payload must be a JSON object.", "invalid_payload");
    }

    const auto name_it = payload.find("tool_name");
    if (name_it == payload.end() || !name_it->is_string()) {
        return payload_error("Hook payload has no tool_name.", "missing_tool_name");
    }
    const auto input_it = payload.find("tool_input");
    if (input_it == payload.end() || !input_it->is_object()) {
        return payload_error("Hook payload has no tool_input object.",
                             "missing_tool_input");
    }

    ToolCall call{name_it->get<std::string>(), CommandRequest{}, std::nullopt};
    const json& tool_input = *input_it;

    if (const auto cwd_it = payload.find("cwd");
        cwd_it != payload.end() && cwd_it->is_string() &&
        !cwd_it->get<std::string>().empty()) {
        call.cwd = std::filesystem::path(cwd_it->get<std::string>());
    }

    if (call.tool_name == "Bash") {
        const auto command_it = tool_input.find("command");
        if (command_it == tool_input.end() || !command_it->is_string()) {
            return payload_error("Bash tool_input has no command string.",
                                 "missing_command");
        }
        call.request = CommandRequest{command_it->get<std::string>()};
        return call;
    }

    const bool is_write = contains(kWriteTools, call.tool_name);
    if (!is_write && !contains(kReadTools, call.tool_name)) {
        return payload_error("Unexpected tool: " + call.tool_name, "unknown_tool");
    }

    auto path = extract_path(tool_input);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    call.request = AccessRequest{core::errors::get_value(path),
                                 is_write ? AccessMode::Write : AccessMode::Read};
    return call;
}

void RequestAdapter::record(const protocol::Settings& settings, const std::string& kind,
                            const std::string& subject, const Verdict& verdict) const {
    if (!settings.logging_enabled) {
        return;
    }
    audit::AuditLog log(core::config::expand_user(settings.log_path, home_));
    auto written = log.record(kind, subject, verdict);
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        LOG_WARN("Audit log unavailable [" + err.code + "]: " + err.message);
    }
}

ExitStatus RequestAdapter::report(const Verdict& verdict, std::ostream& err) {
    if (verdict.decision == Decision::Allow) {
        return ExitStatus::Allow;
    }
    err << kMessagePrefix << verdict.reason << std::endl;
    return ExitStatus::Block;
}

ExitStatus RequestAdapter::handle(const std::string& raw_payload,
                                  const protocol::RuleSet& rules,
                                  std::ostream& err) const {
    try {
        auto parsed = parse_payload(raw_payload);
        if (core::errors::is_error(parsed)) {
            const auto& perr = core::errors::get_error(parsed);
            LOG_WARN("Rejecting hook payload [" + perr.code + "]: " + perr.message);
            const auto verdict = fail_closed_verdict();
            record(rules.settings, "PAYLOAD", perr.message, verdict);
            return report(verdict, err);
        }
        const auto& call = core::errors::get_value(parsed);

        std::filesystem::path working_directory;
        if (call.cwd.has_value()) {
            working_directory = call.cwd.value();
        } else {
            std::error_code ec;
            working_directory = std::filesystem::current_path(ec);
            if (ec) {
                working_directory = "/";
            }
        }

        policy::DecisionEngine engine(rules,
                                      policy::PathMatcher(home_, working_directory));
        const auto verdict = engine.evaluate(call.request);
        LOG_DEBUG(call.tool_name + " -> " + protocol::to_string(verdict.decision) +
                  ": " + verdict.reason);

        record(rules.settings, protocol::request_kind(call.request),
               protocol::request_subject(call.request), verdict);
        return report(verdict, err);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected failure while evaluating hook: ") + e.what());
        return report(fail_closed_verdict(), err);
    }
}

ExitStatus RequestAdapter::handle(const std::string& raw_payload,
                                  std::ostream& err) const {
    auto loaded = policy::RuleStore::load(config_path_);
    if (core::errors::is_error(loaded)) {
        const auto& load_err = core::errors::get_error(loaded);
        LOG_ERROR("Cannot load rules [" + load_err.code + "]: " + load_err.message);
        return report(fail_closed_verdict(), err);
    }
    return handle(raw_payload, core::errors::get_value(loaded), err);
}

}  // namespace hookguard::app
