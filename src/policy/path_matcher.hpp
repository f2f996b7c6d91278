#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include "core/errors/guard_errors.hpp"

namespace hookguard::policy {

struct CompiledGlob {
    std::string source;    // pattern as configured
    std::string expanded;  // after ~ and $VAR expansion
    std::regex regex;
};

// Glob matching over normalized absolute paths.
//
//   *    any run of characters inside one segment
//   ?    one character other than '/'
//   [..] a character class, [!..] negated
//   **   zero or more whole segments; "dir/**" also matches "dir" itself
//
// Patterns starting with "/" or "**" are used as written. Any other relative
// pattern is anchored at the working directory. Matching is case-sensitive
// and purely textual: symlinks are not resolved.
class PathMatcher {
public:
    PathMatcher();
    PathMatcher(std::filesystem::path home, std::filesystem::path working_directory);

    core::errors::Result<CompiledGlob> compile(const std::string& pattern) const;

    std::string normalize(const std::string& path) const;

    // May throw std::regex_error if the regex engine gives up mid-match.
    bool matches(const std::string& path, const CompiledGlob& glob) const;

    // Compiles on every call; a pattern that does not compile never matches.
    bool matches(const std::string& path, const std::string& pattern) const;

    const std::filesystem::path& home() const { return home_; }
    const std::filesystem::path& working_directory() const {
        return working_directory_;
    }

private:
    std::string expand_pattern(const std::string& pattern) const;
    static std::string expand_variables(const std::string& text);
    static std::string glob_to_regex(const std::string& glob);

    std::filesystem::path home_;
    std::filesystem::path working_directory_;
};

}  // namespace hookguard::policy
