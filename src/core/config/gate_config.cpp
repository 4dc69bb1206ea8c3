#include "core/config/gate_config.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace hookgate::core::config {

using errors::ErrorCategory;
using errors::GateError;
using nlohmann::json;

namespace {

GateError config_error(const std::string& message, const std::string& hint = "") {
    return GateError{ErrorCategory::Configuration, message, "invalid_config", hint};
}

std::optional<FailurePolicy> parse_failure_policy(const std::string& text) {
    if (text == "open") return FailurePolicy::Open;
    if (text == "closed") return FailurePolicy::Closed;
    return std::nullopt;
}

bool truthy(const std::string& text) {
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

std::filesystem::path resolve_under(const std::filesystem::path& base,
                                    const std::filesystem::path& value) {
    if (value.is_absolute()) {
        return value.lexically_normal();
    }
    return (base / value).lexically_normal();
}

std::optional<GateError> apply_file(const std::filesystem::path& file, GateConfig& config) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Configuration,
                         "Unable to open config file: " + file.string(),
                         "config_not_found"};
    }
    const json document = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return config_error("Config file is not valid JSON: " + file.string());
    }
    if (!document.is_object()) {
        return config_error("Config file must hold a JSON object: " + file.string());
    }

    // Relative paths in the file are relative to the project, not to the file.
    const std::filesystem::path base = config.project_dir;
    for (const auto& [key, value] : document.items()) {
        if (key == "state_dir" || key == "log_dir" || key == "failure_policy" ||
            key == "log_level" || key == "default_completion_token") {
            if (!value.is_string()) {
                return config_error("Config key '" + key + "' must be a string.");
            }
        }

        if (key == "state_dir") {
            config.state_dir = resolve_under(base, value.get<std::string>());
        } else if (key == "log_dir") {
            config.log_dir = resolve_under(base, value.get<std::string>());
        } else if (key == "failure_policy") {
            const auto policy = parse_failure_policy(value.get<std::string>());
            if (!policy) {
                return config_error("Unknown failure_policy: " + value.get<std::string>(),
                                    "Use \"open\" or \"closed\".");
            }
            config.failure_policy = *policy;
        } else if (key == "log_level") {
            const auto level = logging::parse_log_level(value.get<std::string>());
            if (!level) {
                return config_error("Unknown log_level: " + value.get<std::string>(),
                                    "Use debug, info, warn or error.");
            }
            config.log_level = *level;
        } else if (key == "default_completion_token") {
            if (value.get<std::string>().empty()) {
                return config_error("default_completion_token cannot be empty.");
            }
            config.default_completion_token = value.get<std::string>();
        } else if (key == "command_rules") {
            config.command_rules = value;
        } else if (key == "path_rules") {
            config.path_rules = value;
        } else if (key == "rule_files") {
            if (!value.is_array()) {
                return config_error("Config key 'rule_files' must be an array of paths.");
            }
            for (const auto& entry : value) {
                if (!entry.is_string()) {
                    return config_error("Config key 'rule_files' must be an array of paths.");
                }
                config.rule_files.push_back(resolve_under(base, entry.get<std::string>()));
            }
        } else {
            return config_error("Unknown config key: " + key);
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<GateConfig> load_config(const ConfigOverrides& overrides, const EnvLookup& env) {
    GateConfig config;

    // 1. Project root
    if (overrides.project_dir) {
        config.project_dir = *overrides.project_dir;
    } else if (auto dir = env("HOOKGATE_PROJECT_DIR")) {
        config.project_dir = *dir;
    } else if (auto claude_dir = env("CLAUDE_PROJECT_DIR")) {
        config.project_dir = *claude_dir;
    } else {
        std::error_code ec;
        config.project_dir = std::filesystem::current_path(ec);
        if (ec) {
            return GateError{ErrorCategory::Configuration,
                             "Unable to determine the current directory.",
                             "invalid_project_dir"};
        }
    }
    if (config.project_dir.is_relative()) {
        std::error_code ec;
        config.project_dir = std::filesystem::absolute(config.project_dir, ec);
    }
    config.project_dir = config.project_dir.lexically_normal();

    // 2. Defaults relative to the project
    config.state_dir = config.project_dir / ".hookgate" / "state";
    config.log_dir = config.project_dir / ".hookgate" / "logs";

    // 3. Config file
    if (overrides.config_file) {
        config.config_file = resolve_under(config.project_dir, *overrides.config_file);
    } else if (auto file = env("HOOKGATE_CONFIG")) {
        config.config_file = resolve_under(config.project_dir, *file);
    } else {
        const auto implicit = config.project_dir / ".hookgate" / "config.json";
        std::error_code ec;
        if (std::filesystem::exists(implicit, ec) && !ec) {
            config.config_file = implicit;
        }
    }
    if (config.config_file) {
        if (auto failure = apply_file(*config.config_file, config)) {
            return *failure;
        }
    }

    // 4. Environment
    if (auto dir = env("HOOKGATE_STATE_DIR")) {
        config.state_dir = resolve_under(config.project_dir, *dir);
    }
    if (auto dir = env("HOOKGATE_LOG_DIR")) {
        config.log_dir = resolve_under(config.project_dir, *dir);
    }
    if (auto policy_text = env("HOOKGATE_FAILURE_POLICY")) {
        const auto policy = parse_failure_policy(*policy_text);
        if (!policy) {
            return config_error("Unknown HOOKGATE_FAILURE_POLICY: " + *policy_text,
                                "Use \"open\" or \"closed\".");
        }
        config.failure_policy = *policy;
    }
    if (auto level_text = env("HOOKGATE_LOG_LEVEL")) {
        const auto level = logging::parse_log_level(*level_text);
        if (!level) {
            return config_error("Unknown HOOKGATE_LOG_LEVEL: " + *level_text,
                                "Use debug, info, warn or error.");
        }
        config.log_level = *level;
    }
    if (auto allow = env("HOOKGATE_ALLOW_PROTECTED")) {
        config.allow_protected_override = truthy(*allow);
    }

    return config;
}

std::string to_string(const FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::Open:
            return "open";
        case FailurePolicy::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

}  // namespace hookgate::core::config
