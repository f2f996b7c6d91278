#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include "core/config/config_paths.hpp"
#include "core/errors/guard_errors.hpp"
#include "protocol/request_contract.hpp"
#include "protocol/rule_contract.hpp"
#include "protocol/verdict_contract.hpp"

namespace hookguard::app {

// Host contract: 0 lets the tool run, 2 blocks it and surfaces stderr.
enum class ExitStatus : int {
    Allow = 0,
    Block = 2
};

inline int to_exit_code(const ExitStatus status) { return static_cast<int>(status); }

struct ToolCall {
    std::string tool_name;
    protocol::Request request;
    std::optional<std::filesystem::path> cwd;
};

// Bridges the host's hook payload to the decision engine. Every failure on
// this boundary ends in a block.
class RequestAdapter {
public:
    explicit RequestAdapter(std::filesystem::path config_path,
                            std::filesystem::path home = core::config::home_directory());

    static core::errors::Result<ToolCall> parse_payload(const std::string& raw_payload);

    // Loads the rule document, evaluates, records, reports.
    ExitStatus handle(const std::string& raw_payload, std::ostream& err) const;

    // Same, against a rule set the caller already loaded.
    ExitStatus handle(const std::string& raw_payload, const protocol::RuleSet& rules,
                      std::ostream& err) const;

private:
    void record(const protocol::Settings& settings, const std::string& kind,
                const std::string& subject, const protocol::Verdict& verdict) const;
    static ExitStatus report(const protocol::Verdict& verdict, std::ostream& err);

    std::filesystem::path config_path_;
    std::filesystem::path home_;
};

}  // namespace hookguard::app
