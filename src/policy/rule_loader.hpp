#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "policy/command_guard.hpp"
#include "policy/path_guard.hpp"
#include "policy/rule.hpp"

namespace hookgate::policy {

struct LoadedRules {
    std::vector<Rule> command_rules;
    PathPolicy path_policy;
};

struct GuardSet {
    CommandGuard command;
    PathGuard path;
};

// Section shapes:
//   command_rules: [rule...] or {"replace_defaults": bool, "rules": [rule...]}
//     rule: {"category", "kind": "block"|"allow", "pattern", "reason"}
//   path_rules: {"replace_defaults": bool, "protected": [{"pattern", "exceptions", "reason"}],
//                "exceptions": [glob...], "content_markers": [string...]}
core::errors::Result<core::errors::Ok> apply_command_rules(
    const nlohmann::json& section, const std::string& source, std::vector<Rule>& rules);

core::errors::Result<core::errors::Ok> apply_path_rules(const nlohmann::json& section,
                                                        const std::string& source,
                                                        PathPolicy& policy);

// Built-in defaults, then the config file sections, then each rule file in order.
core::errors::Result<LoadedRules> load_rules(const core::config::GateConfig& config);

// load_rules + compile. A failure here is a ConfigurationError for this invocation.
core::errors::Result<GuardSet> build_guards(const core::config::GateConfig& config);

}  // namespace hookgate::policy
