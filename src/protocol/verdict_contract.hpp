#pragma once

#include <optional>
#include <string>
#include "protocol/rule_contract.hpp"

namespace hookguard::protocol {

// Reason attached to every fail-closed block.
inline constexpr const char* kFailClosedReason =
    "policy evaluation failed, blocking by default";

enum class Decision {
    Allow,
    Block
};

struct Verdict {
    Decision decision = Decision::Block;
    std::string reason;
    std::optional<RuleRef> matched_rule;

    bool allowed() const { return decision == Decision::Allow; }
};

inline bool operator==(const Verdict& lhs, const Verdict& rhs) {
    return lhs.decision == rhs.decision && lhs.reason == rhs.reason &&
           lhs.matched_rule == rhs.matched_rule;
}

inline std::string to_string(const Decision decision) {
    switch (decision) {
        case Decision::Allow:
            return "allow";
        case Decision::Block:
            return "block";
        default:
            return "unknown";
    }
}

}  // namespace hookguard::protocol
