#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"

namespace hookgate::core::config {

// What a gate does when it cannot reach a verdict (malformed envelope,
// broken rule configuration) on a PreInvocation event.
enum class FailurePolicy {
    Open,   // allow, log loudly
    Closed  // block with the failure as the reason
};

struct GateConfig {
    std::filesystem::path project_dir;
    std::filesystem::path state_dir;
    std::filesystem::path log_dir;
    std::optional<std::filesystem::path> config_file;

    FailurePolicy failure_policy = FailurePolicy::Open;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::string default_completion_token = "DONE";
    bool allow_protected_override = false;

    // Rule sections exactly as found in the config file (null when absent),
    // interpreted by policy::load_rules.
    nlohmann::json command_rules;
    nlohmann::json path_rules;
    std::vector<std::filesystem::path> rule_files;
};

// Command-line values; they win over everything else.
struct ConfigOverrides {
    std::optional<std::filesystem::path> project_dir;
    std::optional<std::filesystem::path> config_file;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

// Defaults -> config file -> environment -> command line.
errors::Result<GateConfig> load_config(const ConfigOverrides& overrides,
                               const EnvLookup& env = process_env);

std::string to_string(FailurePolicy policy);

}  // namespace hookgate::core::config
