#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/config/config_paths.hpp"
#include "core/errors/guard_errors.hpp"
#include "protocol/rule_contract.hpp"

namespace hookguard::app {

// Read-only view over the rule document and the audit log. Shares no state
// with the guard process; everything is read from disk on each call.
class StatusView {
public:
    explicit StatusView(std::filesystem::path config_path,
                        std::filesystem::path home = core::config::home_directory());

    core::errors::Result<std::string> render(std::size_t recent_records = 10) const;

    core::errors::Result<std::vector<std::string>> recent_records(std::size_t count) const;

private:
    core::errors::Result<protocol::RuleSet> load_rules() const;
    std::filesystem::path log_path(const protocol::Settings& settings) const;

    std::filesystem::path config_path_;
    std::filesystem::path home_;
};

}  // namespace hookguard::app
