#include "policy/rule_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "core/logging/logger.hpp"

namespace hookguard::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using core::errors::Result;
using protocol::AccessLevel;
using protocol::MatchSyntax;
using protocol::Rule;
using protocol::RuleCategory;
using protocol::RuleSet;
using protocol::Settings;

namespace {

constexpr const char* kSettingsKey = "settings";
constexpr const char* kProtectedPathsKey = "protected_paths";
constexpr const char* kDangerousCommandsKey = "dangerous_commands";
constexpr const char* kSafeZonesKey = "safe_zones";

GuardError config_error(const std::string& message, const std::string& code,
                        const std::string& hint = "") {
    return GuardError{ErrorCategory::Config, message, code, hint};
}

std::optional<std::string> scalar_text(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<bool> parse_bool_text(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    return std::nullopt;
}

Result<Settings> parse_settings(const YAML::Node& node) {
    Settings settings;
    if (!node || node.IsNull()) {
        return settings;
    }
    if (!node.IsMap()) {
        return config_error("'settings' must be a mapping.", "invalid_settings");
    }

    if (const auto& mode_node = node["mode"]; mode_node && !mode_node.IsNull()) {
        const auto text = scalar_text(mode_node);
        const auto mode = text ? protocol::parse_policy_mode(*text) : std::nullopt;
        if (!mode) {
            return config_error("Unknown mode: " + text.value_or("<non-scalar>"),
                                "invalid_mode", "Use 'blocklist' or 'whitelist'.");
        }
        settings.mode = *mode;
    }

    if (const auto& logging_node = node["logging"];
        logging_node && !logging_node.IsNull()) {
        const auto text = scalar_text(logging_node);
        const auto enabled = text ? parse_bool_text(*text) : std::nullopt;
        if (!enabled) {
            return config_error("'logging' must be a boolean.", "invalid_logging",
                                "Use true or false.");
        }
        settings.logging_enabled = *enabled;
    }

    if (const auto& log_node = node["log_file"]; log_node && !log_node.IsNull()) {
        const auto text = scalar_text(log_node);
        if (!text || text->empty()) {
            return config_error("'log_file' must be a non-empty path.",
                                "invalid_log_file");
        }
        settings.log_path = *text;
    }

    return settings;
}

Result<Rule> parse_rule(const YAML::Node& entry, const std::string& location,
                        const RuleCategory category) {
    if (!entry.IsMap()) {
        return config_error(location + " must be a mapping with a 'pattern'.",
                            "invalid_rule");
    }

    Rule rule;
    rule.category = category;

    const auto pattern = scalar_text(entry["pattern"]);
    if (!pattern || pattern->empty()) {
        return config_error(location + " has no pattern.", "missing_pattern",
                            "Every rule needs a non-empty 'pattern' string.");
    }
    rule.pattern = *pattern;

    if (const auto& level_node = entry["level"]; level_node && !level_node.IsNull()) {
        const auto text = scalar_text(level_node);
        const auto level = text ? protocol::parse_access_level(*text) : std::nullopt;
        if (!level) {
            return config_error(
                location + " has unknown level: " + text.value_or("<non-scalar>"),
                "invalid_level", "Use 'block', 'read_only' or 'allow'.");
        }
        rule.level = *level;
    }

    if (const auto& reason_node = entry["reason"];
        reason_node && !reason_node.IsNull()) {
        const auto text = scalar_text(reason_node);
        if (!text) {
            return config_error(location + " reason must be a string.",
                                "invalid_reason");
        }
        rule.reason = *text;
    }

    if (const auto& match_node = entry["match"]; match_node && !match_node.IsNull()) {
        const auto text = scalar_text(match_node);
        const auto syntax = text ? protocol::parse_match_syntax(*text) : std::nullopt;
        if (!syntax) {
            return config_error(
                location + " has unknown match type: " + text.value_or("<non-scalar>"),
                "invalid_match", "Use 'regex' or 'literal'.");
        }
        rule.syntax = *syntax;
    }

    return rule;
}

Result<std::vector<Rule>> parse_category(const YAML::Node& root, const char* key,
                                         const RuleCategory category) {
    std::vector<Rule> rules;
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return rules;
    }
    if (!node.IsSequence()) {
        return config_error(std::string("'") + key + "' must be a list of rules.",
                            "invalid_category");
    }

    rules.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const std::string location =
            std::string(key) + "[" + std::to_string(i) + "]";
        auto parsed = parse_rule(node[i], location, category);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        rules.push_back(core::errors::get_value(parsed));
    }
    return rules;
}

Result<RuleSet> build_rule_set(const YAML::Node& root) {
    RuleSet rules;
    if (!root || root.IsNull()) {
        return rules;
    }
    if (!root.IsMap()) {
        return config_error("Rule document must be a mapping at the top level.",
                            "invalid_document");
    }

    auto settings = parse_settings(root[kSettingsKey]);
    if (core::errors::is_error(settings)) {
        return core::errors::get_error(settings);
    }
    rules.settings = core::errors::get_value(settings);

    struct CategorySlot {
        const char* key;
        RuleCategory category;
        std::vector<Rule>* target;
    };
    const CategorySlot slots[] = {
        {kProtectedPathsKey, RuleCategory::ProtectedPath, &rules.protected_paths},
        {kDangerousCommandsKey, RuleCategory::DangerousCommand,
         &rules.dangerous_commands},
        {kSafeZonesKey, RuleCategory::SafeZone, &rules.safe_zones},
    };
    for (const auto& slot : slots) {
        auto parsed = parse_category(root, slot.key, slot.category);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        *slot.target = core::errors::get_value(parsed);
    }

    return rules;
}

Result<std::string> read_document(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec) || ec) {
        return config_error("Configuration not found: " + config_path.string(),
                            "config_not_found",
                            "Pass --config or set HOOKGUARD_CONFIG.");
    }

    std::ifstream in(config_path);
    if (!in.is_open()) {
        return config_error("Unable to open configuration: " + config_path.string(),
                            "config_unreadable");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return config_error("Unable to read configuration: " + config_path.string(),
                            "config_unreadable");
    }
    return buffer.str();
}

Result<std::filesystem::path> write_document(const std::filesystem::path& config_path,
                                             const std::string& text) {
    std::error_code ec;
    if (config_path.has_parent_path()) {
        std::filesystem::create_directories(config_path.parent_path(), ec);
        if (ec) {
            return GuardError{ErrorCategory::Io,
                              "Unable to create configuration directory: " +
                                  config_path.parent_path().string(),
                              "config_dir_create_failed"};
        }
    }

    // Write beside the target then rename so readers never see half a file.
    auto staging = config_path;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            return GuardError{ErrorCategory::Io,
                              "Unable to open configuration for writing: " +
                                  staging.string(),
                              "config_write_failed"};
        }
        out << text;
        out.flush();
        if (!out.good()) {
            return GuardError{ErrorCategory::Io,
                              "Unable to write configuration: " + staging.string(),
                              "config_write_failed"};
        }
    }

    std::filesystem::rename(staging, config_path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return GuardError{ErrorCategory::Io,
                          "Unable to replace configuration: " + config_path.string(),
                          "config_write_failed"};
    }
    return config_path;
}

void emit_category(YAML::Emitter& out, const char* key,
                   const std::vector<Rule>& rules, const bool path_rules) {
    out << YAML::Key << key << YAML::Value;
    if (rules.empty()) {
        out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
        return;
    }
    out << YAML::BeginSeq;
    for (const auto& rule : rules) {
        out << YAML::BeginMap;
        out << YAML::Key << "pattern" << YAML::Value << YAML::DoubleQuoted
            << rule.pattern;
        if (path_rules || rule.level != AccessLevel::Block) {
            out << YAML::Key << "level" << YAML::Value
                << protocol::to_string(rule.level);
        }
        if (rule.syntax != MatchSyntax::Regex) {
            out << YAML::Key << "match" << YAML::Value
                << protocol::to_string(rule.syntax);
        }
        if (!rule.reason.empty()) {
            out << YAML::Key << "reason" << YAML::Value << YAML::DoubleQuoted
                << rule.reason;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}


// Canonical text for one settings value, as it will appear in the document.
Result<std::string> render_setting(const std::string& key, const std::string& value) {
    if (key == "mode") {
        const auto mode = protocol::parse_policy_mode(value);
        if (!mode) {
            return config_error("Unknown mode: " + value, "invalid_mode",
                                "Use 'blocklist' or 'whitelist'.");
        }
        return protocol::to_string(*mode);
    }
    if (key == "logging") {
        const auto enabled = parse_bool_text(value);
        if (!enabled) {
            return config_error("'logging' must be a boolean.", "invalid_logging",
                                "Use true or false.");
        }
        return std::string(*enabled ? "true" : "false");
    }
    if (key == "log_file") {
        if (value.empty()) {
            return config_error("'log_file' must be a non-empty path.",
                                "invalid_log_file");
        }
        YAML::Emitter out;
        out << YAML::DoubleQuoted << value;
        return std::string(out.c_str());
    }
    return config_error("Unknown setting: " + key, "unknown_setting",
                        "Recognized settings: mode, logging, log_file.");
}

bool setting_applied(const Settings& settings, const std::string& key,
                     const std::string& value) {
    if (key == "mode") {
        return protocol::parse_policy_mode(value) == settings.mode;
    }
    if (key == "logging") {
        return parse_bool_text(value) == settings.logging_enabled;
    }
    return settings.log_path == value;
}

std::size_t indent_of(const std::string& line) {
    return line.find_first_not_of(' ') == std::string::npos
               ? line.size()
               : line.find_first_not_of(' ');
}

bool is_blank_or_comment(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string::npos || line[first] == '#';
}

// Replaces or inserts "<key>: <rendered>" inside a block-style top-level
// settings map, leaving every other line as written. Returns nullopt when the
// settings map is not block style.
std::optional<std::string> edit_setting_line(const std::string& document,
                                             const std::string& key,
                                             const std::string& rendered) {
    std::vector<std::string> lines;
    {
        std::istringstream in(document);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
    }

    std::optional<std::size_t> settings_line;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].rfind(std::string(kSettingsKey) + ":", 0) != 0) {
            continue;
        }
        if (!is_blank_or_comment(lines[i].substr(std::string(kSettingsKey).size() + 1))) {
            return std::nullopt;
        }
        settings_line = i;
        break;
    }

    if (!settings_line) {
        lines.insert(lines.begin(), {std::string(kSettingsKey) + ":",
                                     "  " + key + ": " + rendered});
    } else {
        std::string child_indent;
        std::size_t insert_at = *settings_line + 1;
        bool replaced = false;
        for (std::size_t j = *settings_line + 1; j < lines.size(); ++j) {
            const auto& line = lines[j];
            if (is_blank_or_comment(line)) {
                continue;
            }
            const auto indent = indent_of(line);
            if (indent == 0) {
                break;
            }
            if (child_indent.empty()) {
                child_indent = line.substr(0, indent);
            }
            insert_at = j + 1;
            if (indent != child_indent.size() ||
                line.compare(indent, key.size() + 1, key + ":") != 0) {
                continue;
            }
            // Keep a trailing comment unless the old value was quoted.
            const std::string old_value = line.substr(indent + key.size() + 1);
            std::string comment;
            const auto hash = old_value.find(" #");
            if (hash != std::string::npos &&
                old_value.find_first_of("\"'") == std::string::npos) {
                auto start = hash;
                while (start > 0 && old_value[start - 1] == ' ') {
                    --start;
                }
                comment = old_value.substr(start);
            }
            lines[j] = child_indent + key + ": " + rendered + comment;
            replaced = true;
            break;
        }
        if (!replaced) {
            lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_at),
                         (child_indent.empty() ? std::string("  ") : child_indent) +
                             key + ": " + rendered);
        }
    }

    std::string edited;
    for (const auto& line : lines) {
        edited += line;
        edited += '\n';
    }
    return edited;
}

}  // namespace

Result<RuleSet> RuleStore::parse(const std::string& document) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Unable to parse rule document: ") + e.what(),
                            "config_parse_failed");
    }

    try {
        return build_rule_set(root);
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Malformed rule document: ") + e.what(),
                            "config_parse_failed");
    }
}

Result<RuleSet> RuleStore::load(const std::filesystem::path& config_path) {
    auto document = read_document(config_path);
    if (core::errors::is_error(document)) {
        return core::errors::get_error(document);
    }

    auto parsed = parse(core::errors::get_value(document));
    if (core::errors::is_error(parsed)) {
        auto err = core::errors::get_error(parsed);
        err.message = config_path.string() + ": " + err.message;
        return err;
    }

    const auto& rules = core::errors::get_value(parsed);
    LOG_DEBUG("Loaded " + std::to_string(rules.rule_count()) + " rules from " +
              config_path.string() + " (mode=" +
              protocol::to_string(rules.settings.mode) + ")");
    return parsed;
}

std::string RuleStore::to_yaml(const RuleSet& rules) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << kSettingsKey << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "mode" << YAML::Value
        << protocol::to_string(rules.settings.mode);
    out << YAML::Key << "logging" << YAML::Value << rules.settings.logging_enabled;
    out << YAML::Key << "log_file" << YAML::Value << YAML::DoubleQuoted
        << rules.settings.log_path;
    out << YAML::EndMap;

    emit_category(out, kProtectedPathsKey, rules.protected_paths, true);
    emit_category(out, kDangerousCommandsKey, rules.dangerous_commands, false);
    emit_category(out, kSafeZonesKey, rules.safe_zones, true);

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<std::filesystem::path> RuleStore::save(const std::filesystem::path& config_path,
                                              const RuleSet& rules) {
    return write_document(config_path, to_yaml(rules));
}

Result<std::filesystem::path> RuleStore::update_setting(
    const std::filesystem::path& config_path, const std::string& key,
    const std::string& value) {
    auto rendered = render_setting(key, value);
    if (core::errors::is_error(rendered)) {
        return core::errors::get_error(rendered);
    }

    std::string document;
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec) && !ec) {
        auto existing = read_document(config_path);
        if (core::errors::is_error(existing)) {
            return core::errors::get_error(existing);
        }
        document = core::errors::get_value(existing);
    }

    // Line edit first so comments and layout survive; it only counts if the
    // result loads and carries the new value.
    if (auto edited = edit_setting_line(document, key, core::errors::get_value(rendered))) {
        auto check = parse(*edited);
        if (!core::errors::is_error(check) &&
            setting_applied(core::errors::get_value(check).settings, key, value)) {
            return write_document(config_path, *edited);
        }
    }
    LOG_DEBUG("Rewriting " + config_path.string() + " through the YAML emitter");

    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Unable to parse rule document: ") + e.what(),
                            "config_parse_failed");
    }
    if (!root || root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        return config_error("Rule document must be a mapping at the top level.",
                            "invalid_document");
    }
    if (!root[kSettingsKey] || root[kSettingsKey].IsNull()) {
        root[kSettingsKey] = YAML::Node(YAML::NodeType::Map);
    }
    if (!root[kSettingsKey].IsMap()) {
        return config_error("'settings' must be a mapping.", "invalid_settings");
    }

    if (key == "logging") {
        root[kSettingsKey][key] = core::errors::get_value(rendered) == "true";
    } else if (key == "mode") {
        root[kSettingsKey][key] = core::errors::get_value(rendered);
    } else {
        root[kSettingsKey][key] = value;
    }

    // Refuse to write a document the guard could not load back.
    try {
        auto check = build_rule_set(root);
        if (core::errors::is_error(check)) {
            return core::errors::get_error(check);
        }
    } catch (const YAML::Exception& e) {
        return config_error(std::string("Malformed rule document: ") + e.what(),
                            "config_parse_failed");
    }

    YAML::Emitter out;
    out << root;
    return write_document(config_path, std::string(out.c_str()) + "\n");
}

}  // namespace hookguard::policy
