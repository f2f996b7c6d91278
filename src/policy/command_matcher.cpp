#include "policy/command_matcher.hpp"

namespace hookguard::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using protocol::MatchSyntax;

std::string CommandMatcher::escape_literal(const std::string& text) {
    static const std::string kSpecial = ".^$|()[]{}*+?\\";
    std::string out;
    out.reserve(text.size() * 2);
    for (const char c : text) {
        if (kSpecial.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

core::errors::Result<CompiledCommandPattern> CommandMatcher::compile(
    const std::string& pattern, const MatchSyntax syntax) const {
    if (pattern.empty()) {
        return GuardError{ErrorCategory::RulePattern, "Command pattern is empty.",
                          "invalid_pattern"};
    }

    CompiledCommandPattern compiled;
    compiled.source = pattern;
    compiled.syntax = syntax;
    const std::string expression =
        syntax == MatchSyntax::Literal ? escape_literal(pattern) : pattern;
    try {
        compiled.regex = std::regex(
            expression, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        return GuardError{ErrorCategory::RulePattern,
                          "Invalid command pattern '" + pattern + "': " + e.what(),
                          "invalid_pattern",
                          "Escape regex metacharacters or set 'match: literal'."};
    }
    return compiled;
}

bool CommandMatcher::matches(const std::string& command_text,
                             const CompiledCommandPattern& pattern) const {
    return std::regex_search(command_text, pattern.regex);
}

bool CommandMatcher::matches(const std::string& command_text,
                             const std::string& pattern) const {
    auto compiled = compile(pattern);
    if (core::errors::is_error(compiled)) {
        return false;
    }
    return matches(command_text, core::errors::get_value(compiled));
}

}  // namespace hookguard::policy
