#include "policy/decision_engine.hpp"

#include <regex>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace hookguard::policy {

using protocol::AccessLevel;
using protocol::AccessMode;
using protocol::AccessRequest;
using protocol::CommandRequest;
using protocol::Decision;
using protocol::PolicyMode;
using protocol::Request;
using protocol::Rule;
using protocol::RuleCategory;
using protocol::RuleRef;
using protocol::Verdict;

namespace {

constexpr const char* kNotInSafeZoneReason = "not in an explicit safe zone";
constexpr const char* kNoRestrictionReason = "no matching restriction";
constexpr const char* kCommandPassedReason = "command passed security checks";

std::string reason_or(const Rule& rule, const std::string& fallback) {
    return rule.reason.empty() ? fallback : rule.reason;
}

Verdict fail_closed(const std::string& detail) {
    LOG_ERROR("Rule evaluation failed, blocking: " + detail);
    return Verdict{Decision::Block, protocol::kFailClosedReason, std::nullopt};
}

}  // namespace

DecisionEngine::DecisionEngine(protocol::RuleSet rules, PathMatcher path_matcher,
                               CommandMatcher command_matcher)
    : rules_(std::move(rules)),
      path_matcher_(std::move(path_matcher)),
      command_matcher_(std::move(command_matcher)) {
    compile_rules();
}

void DecisionEngine::compile_rules() {
    auto compile_paths = [this](const std::vector<Rule>& source,
                                std::vector<CompiledRule<CompiledGlob>>& target) {
        for (std::size_t i = 0; i < source.size(); ++i) {
            auto compiled = path_matcher_.compile(source[i].pattern);
            if (core::errors::is_error(compiled)) {
                const auto& err = core::errors::get_error(compiled);
                LOG_WARN("Skipping " + protocol::to_string(source[i].category) +
                         " rule #" + std::to_string(i) + ": " + err.message);
                skipped_rules_.push_back(err);
                continue;
            }
            target.push_back({i, core::errors::get_value(compiled)});
        }
    };
    compile_paths(rules_.safe_zones, safe_zones_);
    compile_paths(rules_.protected_paths, protected_paths_);

    for (std::size_t i = 0; i < rules_.dangerous_commands.size(); ++i) {
        const auto& rule = rules_.dangerous_commands[i];
        auto compiled = command_matcher_.compile(rule.pattern, rule.syntax);
        if (core::errors::is_error(compiled)) {
            const auto& err = core::errors::get_error(compiled);
            LOG_WARN("Skipping dangerous_command rule #" + std::to_string(i) + ": " +
                     err.message);
            skipped_rules_.push_back(err);
            continue;
        }
        dangerous_commands_.push_back({i, core::errors::get_value(compiled)});
    }
}

const Rule* DecisionEngine::rule(const RuleRef& ref) const {
    const auto& category = protocol::rules_in(rules_, ref.category);
    if (ref.index >= category.size()) {
        return nullptr;
    }
    return &category[ref.index];
}

Verdict DecisionEngine::evaluate(const Request& request) const {
    return std::visit([this](const auto& typed) { return evaluate(typed); },
                      request);
}

Verdict DecisionEngine::evaluate(const CommandRequest& request) const {
    if (request.command_text.size() > kMaxSubjectLength) {
        return fail_closed("command text is " +
                           std::to_string(request.command_text.size()) +
                           " bytes, limit is " + std::to_string(kMaxSubjectLength));
    }
    try {
        for (const auto& entry : dangerous_commands_) {
            if (!command_matcher_.matches(request.command_text, entry.compiled)) {
                continue;
            }
            const auto& rule = rules_.dangerous_commands[entry.index];
            LOG_DEBUG("Command matched dangerous pattern: " + rule.pattern);
            return Verdict{
                Decision::Block,
                reason_or(rule, "Matches dangerous command pattern: " + rule.pattern),
                RuleRef{RuleCategory::DangerousCommand, entry.index}};
        }
    } catch (const std::regex_error& e) {
        return fail_closed(e.what());
    }
    return Verdict{Decision::Allow, kCommandPassedReason, std::nullopt};
}

std::optional<Verdict> DecisionEngine::match_safe_zone(
    const AccessRequest& request) const {
    for (const auto& entry : safe_zones_) {
        if (!path_matcher_.matches(request.path, entry.compiled)) {
            continue;
        }
        const auto& rule = rules_.safe_zones[entry.index];
        return Verdict{Decision::Allow,
                       reason_or(rule, "Path is in safe zone: " + rule.pattern),
                       RuleRef{RuleCategory::SafeZone, entry.index}};
    }
    return std::nullopt;
}

std::optional<Verdict> DecisionEngine::match_protected_path(
    const AccessRequest& request) const {
    for (const auto& entry : protected_paths_) {
        if (!path_matcher_.matches(request.path, entry.compiled)) {
            continue;
        }
        const auto& rule = rules_.protected_paths[entry.index];
        const RuleRef ref{RuleCategory::ProtectedPath, entry.index};
        switch (rule.level) {
            case AccessLevel::Block:
                return Verdict{
                    Decision::Block,
                    reason_or(rule, "Path matches protected pattern: " + rule.pattern),
                    ref};
            case AccessLevel::ReadOnly:
                if (request.mode == AccessMode::Write) {
                    return Verdict{
                        Decision::Block,
                        reason_or(rule, "Path is read-only: " + rule.pattern), ref};
                }
                return Verdict{Decision::Allow,
                               "read access to read-only path: " + rule.pattern, ref};
            case AccessLevel::Allow:
                return Verdict{
                    Decision::Allow,
                    reason_or(rule, "Path allowed by rule: " + rule.pattern), ref};
        }
        return fail_closed("unknown access level on rule " + rule.pattern);
    }
    return std::nullopt;
}

Verdict DecisionEngine::evaluate(const AccessRequest& request) const {
    const auto normalized_length = path_matcher_.normalize(request.path).size();
    if (request.path.size() > kMaxSubjectLength || normalized_length > kMaxSubjectLength) {
        return fail_closed("path is " + std::to_string(normalized_length) +
                           " bytes, limit is " + std::to_string(kMaxSubjectLength));
    }
    try {
        if (auto verdict = match_safe_zone(request)) {
            return *verdict;
        }
        if (auto verdict = match_protected_path(request)) {
            return *verdict;
        }
    } catch (const std::regex_error& e) {
        return fail_closed(e.what());
    }

    if (rules_.settings.mode == PolicyMode::Whitelist) {
        return Verdict{Decision::Block, kNotInSafeZoneReason, std::nullopt};
    }
    return Verdict{Decision::Allow, kNoRestrictionReason, std::nullopt};
}

}  // namespace hookguard::policy
