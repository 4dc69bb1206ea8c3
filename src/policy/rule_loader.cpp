#include "policy/rule_loader.hpp"

#include <fstream>
#include <utility>

namespace hookgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;
using core::errors::Ok;
using nlohmann::json;

namespace {

GateError rule_file_error(const std::string& source, const std::string& message) {
    return GateError{ErrorCategory::Configuration, source + ": " + message,
                     "invalid_rule_file"};
}

core::errors::Result<std::vector<std::string>> string_list(const json& value,
                                                           const std::string& source,
                                                           const std::string& key) {
    if (!value.is_array()) {
        return rule_file_error(source, "'" + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return rule_file_error(source, "'" + key + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

core::errors::Result<Rule> parse_command_rule(const json& entry, const std::string& source) {
    if (!entry.is_object()) {
        return rule_file_error(source, "each command rule must be an object");
    }
    for (const char* key : {"category", "pattern"}) {
        const auto it = entry.find(key);
        if (it == entry.end() || !it->is_string() || it->get<std::string>().empty()) {
            return rule_file_error(source, std::string("command rule needs a non-empty '") +
                                               key + "'");
        }
    }

    Rule rule;
    rule.syntax = PatternSyntax::Regex;
    rule.category = entry.at("category").get<std::string>();
    rule.pattern = entry.at("pattern").get<std::string>();

    const auto kind = entry.find("kind");
    if (kind != entry.end()) {
        if (!kind->is_string()) {
            return rule_file_error(source, "'kind' must be \"block\" or \"allow\"");
        }
        const auto text = kind->get<std::string>();
        if (text == "block") {
            rule.kind = RuleKind::Block;
        } else if (text == "allow") {
            rule.kind = RuleKind::AllowException;
        } else {
            return rule_file_error(source, "'kind' must be \"block\" or \"allow\", got " + text);
        }
    }

    const auto reason = entry.find("reason");
    if (reason != entry.end() && !reason->is_string()) {
        return rule_file_error(source, "'reason' must be a string");
    }
    if (reason != entry.end()) {
        rule.reason = reason->get<std::string>();
    }
    if (rule.kind == RuleKind::Block && rule.reason.empty()) {
        return rule_file_error(source, "block rule '" + rule.pattern + "' needs a reason");
    }
    return rule;
}

core::errors::Result<Ok> apply_rule_document(const json& document, const std::string& source,
                                             LoadedRules& loaded) {
    if (!document.is_object()) {
        return rule_file_error(source, "rule file must hold a JSON object");
    }
    for (const auto& [key, value] : document.items()) {
        if (key == "command_rules") {
            auto applied = apply_command_rules(value, source, loaded.command_rules);
            if (core::errors::is_error(applied)) {
                return core::errors::get_error(applied);
            }
        } else if (key == "path_rules") {
            auto applied = apply_path_rules(value, source, loaded.path_policy);
            if (core::errors::is_error(applied)) {
                return core::errors::get_error(applied);
            }
        } else {
            return rule_file_error(source, "unknown key '" + key + "'");
        }
    }
    return Ok{};
}

}  // namespace

core::errors::Result<Ok> apply_command_rules(const json& section, const std::string& source,
                                             std::vector<Rule>& rules) {
    const json* entries = &section;
    if (section.is_object()) {
        const auto replace = section.find("replace_defaults");
        if (replace != section.end()) {
            if (!replace->is_boolean()) {
                return rule_file_error(source, "'replace_defaults' must be a boolean");
            }
            if (replace->get<bool>()) {
                rules.clear();
            }
        }
        const auto list = section.find("rules");
        if (list == section.end()) {
            return Ok{};
        }
        entries = &(*list);
    }
    if (!entries->is_array()) {
        return rule_file_error(source, "'command_rules' must be an array or an object");
    }

    for (const auto& entry : *entries) {
        auto rule = parse_command_rule(entry, source);
        if (core::errors::is_error(rule)) {
            return core::errors::get_error(rule);
        }
        rules.push_back(core::errors::get_value(rule));
    }
    return Ok{};
}

core::errors::Result<Ok> apply_path_rules(const json& section, const std::string& source,
                                          PathPolicy& policy) {
    if (!section.is_object()) {
        return rule_file_error(source, "'path_rules' must be an object");
    }

    const auto replace = section.find("replace_defaults");
    if (replace != section.end()) {
        if (!replace->is_boolean()) {
            return rule_file_error(source, "'replace_defaults' must be a boolean");
        }
        if (replace->get<bool>()) {
            policy = PathPolicy{};
        }
    }

    for (const auto& [key, value] : section.items()) {
        if (key == "replace_defaults") {
            continue;
        }
        if (key == "protected") {
            if (!value.is_array()) {
                return rule_file_error(source, "'protected' must be an array");
            }
            for (const auto& entry : value) {
                if (!entry.is_object()) {
                    return rule_file_error(source, "each protected entry must be an object");
                }
                const auto pattern = entry.find("pattern");
                if (pattern == entry.end() || !pattern->is_string() ||
                    pattern->get<std::string>().empty()) {
                    return rule_file_error(source, "protected entry needs a non-empty 'pattern'");
                }
                ProtectedPath protected_path;
                protected_path.pattern = pattern->get<std::string>();
                protected_path.reason = "Protected path.";
                const auto reason = entry.find("reason");
                if (reason != entry.end()) {
                    if (!reason->is_string()) {
                        return rule_file_error(source, "'reason' must be a string");
                    }
                    protected_path.reason = reason->get<std::string>();
                }
                const auto exceptions = entry.find("exceptions");
                if (exceptions != entry.end()) {
                    auto list = string_list(*exceptions, source, "exceptions");
                    if (core::errors::is_error(list)) {
                        return core::errors::get_error(list);
                    }
                    protected_path.exceptions = core::errors::get_value(list);
                }
                policy.protected_paths.push_back(std::move(protected_path));
            }
        } else if (key == "exceptions" || key == "content_markers") {
            auto list = string_list(value, source, key);
            if (core::errors::is_error(list)) {
                return core::errors::get_error(list);
            }
            auto& target = key == "exceptions" ? policy.exceptions : policy.content_markers;
            const auto& items = core::errors::get_value(list);
            target.insert(target.end(), items.begin(), items.end());
        } else {
            return rule_file_error(source, "unknown path_rules key '" + key + "'");
        }
    }
    return Ok{};
}

core::errors::Result<LoadedRules> load_rules(const core::config::GateConfig& config) {
    LoadedRules loaded;
    loaded.command_rules = default_command_rules();
    loaded.path_policy = default_path_policy();

    const std::string config_source =
        config.config_file ? config.config_file->string() : std::string("config");
    if (!config.command_rules.is_null()) {
        auto applied = apply_command_rules(config.command_rules, config_source,
                                           loaded.command_rules);
        if (core::errors::is_error(applied)) {
            return core::errors::get_error(applied);
        }
    }
    if (!config.path_rules.is_null()) {
        auto applied = apply_path_rules(config.path_rules, config_source, loaded.path_policy);
        if (core::errors::is_error(applied)) {
            return core::errors::get_error(applied);
        }
    }

    for (const auto& file : config.rule_files) {
        std::ifstream in(file);
        if (!in.is_open()) {
            return GateError{ErrorCategory::Configuration,
                             "Unable to open rule file: " + file.string(),
                             "invalid_rule_file"};
        }
        const json document = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (document.is_discarded()) {
            return rule_file_error(file.string(), "not valid JSON");
        }
        auto applied = apply_rule_document(document, file.string(), loaded);
        if (core::errors::is_error(applied)) {
            return core::errors::get_error(applied);
        }
    }
    return loaded;
}

core::errors::Result<GuardSet> build_guards(const core::config::GateConfig& config) {
    auto loaded = load_rules(config);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& rules = core::errors::get_value(loaded);

    auto command = CommandGuard::create(rules.command_rules);
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    auto path = PathGuard::create(rules.path_policy, config.allow_protected_override);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return GuardSet{std::move(std::get<CommandGuard>(command)),
                    std::move(std::get<PathGuard>(path))};
}

}  // namespace hookgate::policy
