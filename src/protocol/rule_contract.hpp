#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/config/config_paths.hpp"

namespace hookguard::protocol {

enum class RuleCategory {
    DangerousCommand,
    ProtectedPath,
    SafeZone
};

enum class AccessLevel {
    Block,
    ReadOnly,
    Allow
};

// How a dangerous-command pattern is interpreted.
enum class MatchSyntax {
    Regex,
    Literal
};

enum class PolicyMode {
    Blocklist,
    Whitelist
};

struct Rule {
    std::string pattern;
    RuleCategory category = RuleCategory::ProtectedPath;
    AccessLevel level = AccessLevel::Block;
    std::string reason;
    MatchSyntax syntax = MatchSyntax::Regex;
};

struct Settings {
    PolicyMode mode = PolicyMode::Blocklist;
    bool logging_enabled = true;
    std::string log_path = core::config::kDefaultLogFile;
};

// Categories are kept apart; order inside each vector is configuration order.
struct RuleSet {
    Settings settings;
    std::vector<Rule> protected_paths;
    std::vector<Rule> dangerous_commands;
    std::vector<Rule> safe_zones;

    std::size_t rule_count() const {
        return protected_paths.size() + dangerous_commands.size() + safe_zones.size();
    }
};

// Positional back-reference into a RuleSet.
struct RuleRef {
    RuleCategory category;
    std::size_t index = 0;
};

inline bool operator==(const RuleRef& lhs, const RuleRef& rhs) {
    return lhs.category == rhs.category && lhs.index == rhs.index;
}

inline const std::vector<Rule>& rules_in(const RuleSet& rules,
                                          const RuleCategory category) {
    switch (category) {
        case RuleCategory::DangerousCommand:
            return rules.dangerous_commands;
        case RuleCategory::SafeZone:
            return rules.safe_zones;
        case RuleCategory::ProtectedPath:
        default:
            return rules.protected_paths;
    }
}

inline std::string to_string(const RuleCategory category) {
    switch (category) {
        case RuleCategory::DangerousCommand:
            return "dangerous_command";
        case RuleCategory::ProtectedPath:
            return "protected_path";
        case RuleCategory::SafeZone:
            return "safe_zone";
        default:
            return "unknown";
    }
}

inline std::string to_string(const AccessLevel level) {
    switch (level) {
        case AccessLevel::Block:
            return "block";
        case AccessLevel::ReadOnly:
            return "read_only";
        case AccessLevel::Allow:
            return "allow";
        default:
            return "unknown";
    }
}

inline std::string to_string(const MatchSyntax syntax) {
    switch (syntax) {
        case MatchSyntax::Regex:
            return "regex";
        case MatchSyntax::Literal:
            return "literal";
        default:
            return "unknown";
    }
}

inline std::string to_string(const PolicyMode mode) {
    switch (mode) {
        case PolicyMode::Blocklist:
            return "blocklist";
        case PolicyMode::Whitelist:
            return "whitelist";
        default:
            return "unknown";
    }
}

inline std::optional<AccessLevel> parse_access_level(const std::string& text) {
    if (text == "block") return AccessLevel::Block;
    if (text == "read_only") return AccessLevel::ReadOnly;
    if (text == "allow") return AccessLevel::Allow;
    return std::nullopt;
}

inline std::optional<MatchSyntax> parse_match_syntax(const std::string& text) {
    if (text == "regex") return MatchSyntax::Regex;
    if (text == "literal") return MatchSyntax::Literal;
    return std::nullopt;
}

inline std::optional<PolicyMode> parse_policy_mode(const std::string& text) {
    if (text == "blocklist") return PolicyMode::Blocklist;
    if (text == "whitelist") return PolicyMode::Whitelist;
    return std::nullopt;
}

}  // namespace hookguard::protocol
