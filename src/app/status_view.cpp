#include "app/status_view.hpp"

#include <sstream>
#include <utility>
#include "audit/audit_log.hpp"
#include "policy/rule_store.hpp"

namespace hookguard::app {

StatusView::StatusView(std::filesystem::path config_path, std::filesystem::path home)
    : config_path_(std::move(config_path)), home_(std::move(home)) {}

core::errors::Result<protocol::RuleSet> StatusView::load_rules() const {
    return policy::RuleStore::load(config_path_);
}

std::filesystem::path StatusView::log_path(const protocol::Settings& settings) const {
    return core::config::expand_user(settings.log_path, home_);
}

core::errors::Result<std::vector<std::string>> StatusView::recent_records(
    const std::size_t count) const {
    auto rules = load_rules();
    if (core::errors::is_error(rules)) {
        return core::errors::get_error(rules);
    }
    audit::AuditLog log(log_path(core::errors::get_value(rules).settings));
    return log.tail(count);
}

core::errors::Result<std::string> StatusView::render(const std::size_t recent) const {
    auto loaded = load_rules();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& rules = core::errors::get_value(loaded);
    const auto& settings = rules.settings;

    audit::AuditLog log(log_path(settings));
    auto stats = log.stats();
    if (core::errors::is_error(stats)) {
        return core::errors::get_error(stats);
    }
    auto records = log.tail(recent);
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }

    std::ostringstream out;
    out << "Config      : " << config_path_.string() << "\n"
        << "Mode        : " << protocol::to_string(settings.mode) << "\n"
        << "Logging     : " << (settings.logging_enabled ? "enabled" : "disabled") << "\n"
        << "Log file    : " << log.path().string() << "\n"
        << "Rules       : " << rules.protected_paths.size() << " protected paths, "
        << rules.dangerous_commands.size() << " dangerous commands, "
        << rules.safe_zones.size() << " safe zones\n"
        << "Decisions   : " << core::errors::get_value(stats).allowed << " allowed, "
        << core::errors::get_value(stats).blocked << " blocked\n";

    const auto& lines = core::errors::get_value(records);
    out << "\nRecent activity:\n";
    if (lines.empty()) {
        out << "  (none)\n";
    }
    for (const auto& line : lines) {
        out << "  " << line << "\n";
    }
    return out.str();
}

}  // namespace hookguard::app
