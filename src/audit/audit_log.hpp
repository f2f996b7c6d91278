#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/guard_errors.hpp"
#include "protocol/request_contract.hpp"
#include "protocol/verdict_contract.hpp"

namespace hookguard::audit {

struct AuditStats {
    std::size_t allowed = 0;
    std::size_t blocked = 0;
};

// Append-only decision log, one line per verdict:
//   [<timestamp>] <KIND> <DECISION>: <summary> | <reason>
// The engine only ever writes here; the status view reads it back.
class AuditLog {
public:
    static constexpr std::size_t kSummaryLimit = 100;

    explicit AuditLog(std::filesystem::path log_path);

    core::errors::Result<std::filesystem::path> record(
        const protocol::Request& request, const protocol::Verdict& verdict) const;

    // For decisions taken before a Request could be built (bad payloads).
    core::errors::Result<std::filesystem::path> record(
        const std::string& kind, const std::string& subject,
        const protocol::Verdict& verdict) const;

    core::errors::Result<std::vector<std::string>> tail(std::size_t count) const;

    core::errors::Result<AuditStats> stats() const;

    const std::filesystem::path& path() const { return log_path_; }

    static std::string format_record(const std::string& timestamp,
                                     const std::string& kind,
                                     const std::string& subject,
                                     const protocol::Verdict& verdict);

    static std::string summarize(const std::string& subject);

private:
    std::filesystem::path log_path_;
};

}  // namespace hookguard::audit
