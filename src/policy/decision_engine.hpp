#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "core/errors/guard_errors.hpp"
#include "policy/command_matcher.hpp"
#include "policy/path_matcher.hpp"
#include "protocol/request_contract.hpp"
#include "protocol/rule_contract.hpp"
#include "protocol/verdict_contract.hpp"

namespace hookguard::policy {

// Applies the precedence policy to one request.
//
// Path access:  safe zones, then protected paths, then the mode default.
// Commands:     dangerous-command rules only; the mode does not apply.
//
// Within a category the first rule in configuration order decides. Rules
// whose pattern does not compile are dropped at construction and reported by
// skipped_rules(). If matching fails at evaluation time the verdict is block.
// Subjects longer than kMaxSubjectLength are blocked without matching: the
// std::regex executor recurses per input character.
class DecisionEngine {
public:
    static constexpr std::size_t kMaxSubjectLength = 16 * 1024;

    explicit DecisionEngine(protocol::RuleSet rules,
                            PathMatcher path_matcher = PathMatcher(),
                            CommandMatcher command_matcher = CommandMatcher());

    protocol::Verdict evaluate(const protocol::Request& request) const;
    protocol::Verdict evaluate(const protocol::CommandRequest& request) const;
    protocol::Verdict evaluate(const protocol::AccessRequest& request) const;

    const protocol::Rule* rule(const protocol::RuleRef& ref) const;

    const std::vector<core::errors::GuardError>& skipped_rules() const {
        return skipped_rules_;
    }

private:
    template <typename Compiled>
    struct CompiledRule {
        std::size_t index;
        Compiled compiled;
    };

    void compile_rules();

    std::optional<protocol::Verdict> match_safe_zone(
        const protocol::AccessRequest& request) const;
    std::optional<protocol::Verdict> match_protected_path(
        const protocol::AccessRequest& request) const;

    protocol::RuleSet rules_;
    PathMatcher path_matcher_;
    CommandMatcher command_matcher_;

    std::vector<CompiledRule<CompiledGlob>> safe_zones_;
    std::vector<CompiledRule<CompiledGlob>> protected_paths_;
    std::vector<CompiledRule<CompiledCommandPattern>> dangerous_commands_;
    std::vector<core::errors::GuardError> skipped_rules_;
};

}  // namespace hookguard::policy
