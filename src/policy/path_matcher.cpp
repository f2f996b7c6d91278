#include "policy/path_matcher.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>
#include "core/config/config_paths.hpp"

namespace hookguard::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

std::filesystem::path current_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::filesystem::path("/");
    }
    return cwd;
}

bool is_name_start(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string collapse_separators(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

}  // namespace

PathMatcher::PathMatcher()
    : PathMatcher(core::config::home_directory(), current_directory()) {}

PathMatcher::PathMatcher(std::filesystem::path home,
                         std::filesystem::path working_directory)
    : home_(std::move(home)), working_directory_(std::move(working_directory)) {}

std::string PathMatcher::expand_variables(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            out.push_back(text[i]);
            continue;
        }

        std::size_t name_begin = i + 1;
        std::size_t name_end = name_begin;
        bool braced = false;
        if (text[name_begin] == '{') {
            braced = true;
            ++name_begin;
            name_end = text.find('}', name_begin);
            if (name_end == std::string::npos) {
                out.push_back(text[i]);
                continue;
            }
        } else {
            if (!is_name_start(text[name_begin])) {
                out.push_back(text[i]);
                continue;
            }
            while (name_end < text.size() && is_name_char(text[name_end])) {
                ++name_end;
            }
        }

        const std::string name = text.substr(name_begin, name_end - name_begin);
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        const std::size_t consumed_end = braced ? name_end + 1 : name_end;
        if (value == nullptr) {
            // Unset variables stay literal so the pattern cannot widen.
            out.append(text, i, consumed_end - i);
        } else {
            out.append(value);
        }
        i = consumed_end - 1;
    }
    return out;
}

std::string PathMatcher::expand_pattern(const std::string& pattern) const {
    std::string expanded = expand_variables(
        core::config::expand_user(pattern, home_));
    const bool anchored = !expanded.empty() &&
                          (expanded[0] == '/' || expanded.rfind("**", 0) == 0);
    if (!anchored) {
        expanded = working_directory_.string() + "/" + expanded;
    }
    return collapse_separators(expanded);
}

std::string PathMatcher::glob_to_regex(const std::string& glob) {
    std::string out = "^";
    const std::size_t n = glob.size();
    std::size_t i = 0;
    while (i < n) {
        const char c = glob[i];
        if (c == '*') {
            if (i + 1 < n && glob[i + 1] == '*') {
                const std::size_t after = i + 2;
                const bool segment_start = i == 0 || glob[i - 1] == '/';
                const bool segment_end = after == n || glob[after] == '/';
                if (segment_start && segment_end) {
                    if (after == n) {
                        if (!out.empty() && out.back() == '/') {
                            out.pop_back();
                            out += "(?:/.*)?";
                        } else {
                            out += ".*";
                        }
                        i = after;
                    } else {
                        out += "(?:.*/)?";
                        i = after + 1;
                    }
                } else {
                    out += ".*";
                    i = after;
                }
                continue;
            }
            out += "[^/]*";
        } else if (c == '?') {
            out += "[^/]";
        } else if (c == '[') {
            const std::size_t close = glob.find(']', i + 2);
            if (close == std::string::npos) {
                out += "\\[";
            } else {
                std::string body = glob.substr(i + 1, close - i - 1);
                out += '[';
                std::size_t start = 0;
                if (!body.empty() && (body[0] == '!' || body[0] == '^')) {
                    out += '^';
                    start = 1;
                }
                for (std::size_t k = start; k < body.size(); ++k) {
                    if (body[k] == '\\' || body[k] == '[' || body[k] == ']') {
                        out += '\\';
                    }
                    out += body[k];
                }
                out += ']';
                i = close + 1;
                continue;
            }
        } else if (std::string(".^$+{}()|\\").find(c) != std::string::npos) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
        ++i;
    }
    out += '$';
    return out;
}

core::errors::Result<CompiledGlob> PathMatcher::compile(const std::string& pattern) const {
    if (pattern.empty()) {
        return GuardError{ErrorCategory::RulePattern, "Path pattern is empty.",
                          "invalid_pattern"};
    }

    CompiledGlob glob;
    glob.source = pattern;
    glob.expanded = expand_pattern(pattern);
    try {
        glob.regex = std::regex(glob_to_regex(glob.expanded), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return GuardError{ErrorCategory::RulePattern,
                          "Invalid path pattern '" + pattern + "': " + e.what(),
                          "invalid_pattern"};
    }
    return glob;
}

std::string PathMatcher::normalize(const std::string& path) const {
    if (path.empty()) {
        return {};
    }
    std::filesystem::path candidate(core::config::expand_user(path, home_));
    if (candidate.is_relative()) {
        candidate = working_directory_ / candidate;
    }
    return collapse_separators(candidate.lexically_normal().string());
}

bool PathMatcher::matches(const std::string& path, const CompiledGlob& glob) const {
    if (path.empty()) {
        return false;
    }
    return std::regex_match(normalize(path), glob.regex);
}

bool PathMatcher::matches(const std::string& path, const std::string& pattern) const {
    auto compiled = compile(pattern);
    if (core::errors::is_error(compiled)) {
        return false;
    }
    return matches(path, core::errors::get_value(compiled));
}

}  // namespace hookguard::policy
