#pragma once

#include <regex>
#include <string>
#include "core/errors/guard_errors.hpp"
#include "protocol/rule_contract.hpp"

namespace hookguard::policy {

struct CompiledCommandPattern {
    std::string source;
    protocol::MatchSyntax syntax = protocol::MatchSyntax::Regex;
    std::regex regex;
};

// Unanchored, case-insensitive search over the full command text. The command
// is not tokenized: pipes, subshells and argument order are invisible here.
class CommandMatcher {
public:
    core::errors::Result<CompiledCommandPattern> compile(
        const std::string& pattern,
        protocol::MatchSyntax syntax = protocol::MatchSyntax::Regex) const;

    // May throw std::regex_error if the regex engine gives up mid-search.
    bool matches(const std::string& command_text,
                 const CompiledCommandPattern& pattern) const;

    // Compiles on every call; a pattern that does not compile never matches.
    bool matches(const std::string& command_text, const std::string& pattern) const;

private:
    static std::string escape_literal(const std::string& text);
};

}  // namespace hookguard::policy
