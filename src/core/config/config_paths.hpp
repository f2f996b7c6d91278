#pragma once
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <pwd.h>
#include <unistd.h>

namespace hookguard::core::config {

    inline constexpr const char* kConfigEnvVar = "HOOKGUARD_CONFIG";
    inline constexpr const char* kLogLevelEnvVar = "HOOKGUARD_LOG_LEVEL";
    inline constexpr const char* kDefaultLogFile = "~/.claude/defense.log";

    // HOME first, then the password database. Empty when neither is known.
    inline std::filesystem::path home_directory() {
        const char* home = std::getenv("HOME");
        if (home != nullptr && home[0] != '\0') {
            return std::filesystem::path(home);
        }
        const passwd* entry = ::getpwuid(::getuid());
        if (entry != nullptr && entry->pw_dir != nullptr) {
            return std::filesystem::path(entry->pw_dir);
        }
        return {};
    }

    // Expands a leading "~" or "~/" only; "~user" forms are left untouched.
    inline std::string expand_user(const std::string& text,
                                   const std::filesystem::path& home) {
        if (text.empty() || text[0] != '~') {
            return text;
        }
        if (text.size() == 1) {
            return home.string();
        }
        if (text[1] != '/') {
            return text;
        }
        return home.string() + text.substr(1);
    }

    // Lookup order: explicit path, $HOOKGUARD_CONFIG, next to the binary,
    // then the per-user install location.
    inline std::vector<std::filesystem::path> config_candidates(
        const std::optional<std::filesystem::path>& explicit_path,
        const std::filesystem::path& executable_dir) {
        std::vector<std::filesystem::path> candidates;
        if (explicit_path.has_value()) {
            candidates.push_back(explicit_path.value());
            return candidates;
        }
        const char* from_env = std::getenv(kConfigEnvVar);
        if (from_env != nullptr && from_env[0] != '\0') {
            candidates.emplace_back(from_env);
        }
        if (!executable_dir.empty()) {
            candidates.push_back(executable_dir.parent_path() / "config" / "patterns.yaml");
        }
        const auto home = home_directory();
        if (!home.empty()) {
            candidates.push_back(home / ".claude" / "hooks" / "unified-defense" /
                                 "config" / "patterns.yaml");
        }
        return candidates;
    }

    // First existing candidate, else the first candidate so that the
    // loader can report which file it expected.
    inline std::filesystem::path resolve_config_path(
        const std::optional<std::filesystem::path>& explicit_path,
        const std::filesystem::path& executable_dir) {
        const auto candidates = config_candidates(explicit_path, executable_dir);
        for (const auto& candidate : candidates) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
                return candidate;
            }
        }
        if (candidates.empty()) {
            return std::filesystem::path("config") / "patterns.yaml";
        }
        return candidates.front();
    }

} // namespace hookguard::core::config
