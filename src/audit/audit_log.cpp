#include "audit/audit_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace hookguard::audit {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
                        1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis;
    return out.str();
}

// Keeps every record on one physical line.
std::string escape_line_breaks(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else {
            out += c;
        }
    }
    return out;
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return text;
}

}  // namespace

AuditLog::AuditLog(std::filesystem::path log_path) : log_path_(std::move(log_path)) {}

std::string AuditLog::summarize(const std::string& subject) {
    if (subject.size() <= kSummaryLimit) {
        return subject;
    }
    std::size_t cut = kSummaryLimit;
    // Do not split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(subject[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return subject.substr(0, cut) + "...";
}

std::string AuditLog::format_record(const std::string& timestamp,
                                    const std::string& kind,
                                    const std::string& subject,
                                    const protocol::Verdict& verdict) {
    std::ostringstream out;
    out << '[' << timestamp << "] " << kind << ' '
        << upper(protocol::to_string(verdict.decision)) << ": "
        << escape_line_breaks(summarize(subject)) << " | "
        << escape_line_breaks(verdict.reason);
    return out.str();
}

core::errors::Result<std::filesystem::path> AuditLog::record(
    const protocol::Request& request, const protocol::Verdict& verdict) const {
    return record(protocol::request_kind(request), protocol::request_subject(request),
                  verdict);
}

core::errors::Result<std::filesystem::path> AuditLog::record(
    const std::string& kind, const std::string& subject,
    const protocol::Verdict& verdict) const {
    if (log_path_.empty()) {
        return GuardError{ErrorCategory::Io, "Audit log path is empty.",
                          "invalid_log_path"};
    }

    std::error_code ec;
    if (log_path_.has_parent_path()) {
        std::filesystem::create_directories(log_path_.parent_path(), ec);
        if (ec) {
            return GuardError{ErrorCategory::Io,
                              "Unable to create log directory: " +
                                  log_path_.parent_path().string(),
                              "log_dir_create_failed"};
        }
    }

    // Append mode: concurrent guard processes interleave whole lines.
    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return GuardError{ErrorCategory::Io,
                          "Unable to open audit log: " + log_path_.string(),
                          "log_open_failed"};
    }

    out << format_record(iso8601_now(), kind, subject, verdict) << "\n";
    out.flush();
    if (!out.good()) {
        return GuardError{ErrorCategory::Io,
                          "Unable to write audit record: " + log_path_.string(),
                          "log_write_failed"};
    }
    return log_path_;
}

core::errors::Result<std::vector<std::string>> AuditLog::tail(
    const std::size_t count) const {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::exists(log_path_, ec) || ec) {
        return lines;
    }

    std::ifstream in(log_path_);
    if (!in.is_open()) {
        return GuardError{ErrorCategory::Io,
                          "Unable to open audit log: " + log_path_.string(),
                          "log_open_failed"};
    }

    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        if (count == 0) {
            continue;
        }
        window.push_back(line);
        if (window.size() > count) {
            window.pop_front();
        }
    }
    lines.assign(window.begin(), window.end());
    return lines;
}

core::errors::Result<AuditStats> AuditLog::stats() const {
    AuditStats stats;
    std::error_code ec;
    if (!std::filesystem::exists(log_path_, ec) || ec) {
        return stats;
    }

    std::ifstream in(log_path_);
    if (!in.is_open()) {
        return GuardError{ErrorCategory::Io,
                          "Unable to open audit log: " + log_path_.string(),
                          "log_open_failed"};
    }

    // Decision is the third token: "[ts] KIND DECISION: ...".
    std::string line;
    while (std::getline(in, line)) {
        const auto stamp_end = line.find("] ");
        if (stamp_end == std::string::npos) {
            continue;
        }
        const auto kind_end = line.find(' ', stamp_end + 2);
        if (kind_end == std::string::npos) {
            continue;
        }
        const auto decision = line.substr(kind_end + 1, 6);
        if (decision == "BLOCK:") {
            ++stats.blocked;
        } else if (decision == "ALLOW:") {
            ++stats.allowed;
        }
    }
    return stats;
}

}  // namespace hookguard::audit
