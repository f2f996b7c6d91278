#include <cstdlib>
#include <optional>
#include <gtest/gtest.h>
#include "core/config/config_paths.hpp"
#include "test_support.hpp"

namespace {

using hookguard::core::config::config_candidates;
using hookguard::core::config::expand_user;
using hookguard::core::config::kConfigEnvVar;
using hookguard::core::config::resolve_config_path;
using hookguard::testing::TempDir;
using hookguard::testing::write_file;

TEST(ConfigPathsTest, ExpandsLeadingTildeOnly) {
    EXPECT_EQ(expand_user("~", "/home/dev"), "/home/dev");
    EXPECT_EQ(expand_user("~/.claude/defense.log", "/home/dev"),
              "/home/dev/.claude/defense.log");
    EXPECT_EQ(expand_user("~root/x", "/home/dev"), "~root/x");
    EXPECT_EQ(expand_user("/var/log/~/x", "/home/dev"), "/var/log/~/x");
}

TEST(ConfigPathsTest, ExplicitPathIsTheOnlyCandidate) {
    const auto candidates =
        config_candidates(std::filesystem::path("/opt/guard.yaml"), "/usr/local/bin");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].string(), "/opt/guard.yaml");
}

TEST(ConfigPathsTest, EnvironmentComesBeforeInstallLocation) {
    ::setenv(kConfigEnvVar, "/srv/policy.yaml", 1);
    const auto candidates = config_candidates(std::nullopt, "/opt/hookguard/bin");
    ::unsetenv(kConfigEnvVar);

    ASSERT_GE(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].string(), "/srv/policy.yaml");
    EXPECT_EQ(candidates[1].string(), "/opt/hookguard/config/patterns.yaml");
}

TEST(ConfigPathsTest, ResolvesFirstExistingCandidate) {
    TempDir dir("config_paths");
    const auto bin_dir = dir.root() / "bin";
    const auto installed = dir.root() / "config" / "patterns.yaml";
    write_file(installed, "settings: {}\n");

    ::setenv(kConfigEnvVar, (dir.root() / "missing.yaml").c_str(), 1);
    const auto resolved = resolve_config_path(std::nullopt, bin_dir);
    ::unsetenv(kConfigEnvVar);
    EXPECT_EQ(resolved.string(), installed.string());

    const auto explicit_missing =
        resolve_config_path(dir.root() / "nowhere.yaml", bin_dir);
    EXPECT_EQ(explicit_missing.string(), (dir.root() / "nowhere.yaml").string());
}

}  // namespace
