#pragma once

#include <filesystem>
#include <string>
#include "core/errors/guard_errors.hpp"
#include "protocol/rule_contract.hpp"

namespace hookguard::policy {

// Reads and writes the YAML rule document (patterns.yaml).
//
// Loading validates the whole schema up front: a document that loads is never
// re-inspected per request. Pattern compilation is left to the matchers so
// that one bad regex only costs its own rule.
class RuleStore {
public:
    static core::errors::Result<protocol::RuleSet> load(
        const std::filesystem::path& config_path);

    static core::errors::Result<protocol::RuleSet> parse(const std::string& document);

    static std::string to_yaml(const protocol::RuleSet& rules);

    static core::errors::Result<std::filesystem::path> save(
        const std::filesystem::path& config_path, const protocol::RuleSet& rules);

    // Rewrites one key of the settings map, keeping every other part of the
    // document. Recognized keys: mode, logging, log_file.
    static core::errors::Result<std::filesystem::path> update_setting(
        const std::filesystem::path& config_path, const std::string& key,
        const std::string& value);
};

}  // namespace hookguard::policy
