#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace hookgate::app::cli {

    using namespace hookgate::core::errors;
    using hookgate::protocol::CommandKind;
    using hookgate::protocol::GateRequest;

    namespace {

    constexpr const char* kUsage =
        "Usage: hookgate <hook|loop-setup|loop-cancel|loop-status|doctor> [options]";

    // 1. Raw options (internal only)
    struct RawCliOptions {
        std::optional<std::string> project_dir;
        std::optional<std::string> config_file;
        std::optional<std::string> session;
        std::optional<std::string> max_iterations;
        std::optional<std::string> completion_promise;
        std::optional<std::string> task;
    };

    std::optional<CommandKind> parse_command(const std::string& command) {
        if (command == "hook")        return CommandKind::Hook;
        if (command == "loop-setup")  return CommandKind::LoopSetup;
        if (command == "loop-cancel") return CommandKind::LoopCancel;
        if (command == "loop-status") return CommandKind::LoopStatus;
        if (command == "doctor")      return CommandKind::Doctor;
        return std::nullopt;
    }

    GateError missing_value(const std::string& flag) {
        return GateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
    }

    GateError not_for_command(const std::string& flag, CommandKind command) {
        return GateError{ErrorCategory::Input,
                         flag + " is not valid for " + hookgate::protocol::to_string(command),
                         "unknown_argument"};
    }

    } // namespace

    Result<GateRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const auto command = parse_command(argv[1]);
        if (!command.has_value()) {
            return GateError{ErrorCategory::Input, "Unknown command: " + std::string(argv[1]),
                             "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser phase: just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* target = nullptr;
            if (flag == "--project-dir") {
                target = &raw.project_dir;
            } else if (flag == "--config") {
                target = &raw.config_file;
            } else if (flag == "--session") {
                target = &raw.session;
            } else if (flag == "--max-iterations") {
                target = &raw.max_iterations;
            } else if (flag == "--completion-promise") {
                target = &raw.completion_promise;
            } else if (flag == "--task") {
                target = &raw.task;
            } else {
                return GateError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return missing_value(flag);
            }
            *target = args[++i];
        }

        // 3. Validator phase: enforce per-command flags and bounds
        GateRequest req;
        req.command = command.value();
        if (raw.project_dir) req.overrides.project_dir = std::filesystem::path(raw.project_dir.value());
        if (raw.config_file) req.overrides.config_file = std::filesystem::path(raw.config_file.value());

        const bool loop_command = req.command == CommandKind::LoopSetup ||
                                  req.command == CommandKind::LoopCancel ||
                                  req.command == CommandKind::LoopStatus;
        if (raw.session) {
            if (!loop_command) {
                return not_for_command("--session", req.command);
            }
            if (raw.session->empty()) {
                return GateError{ErrorCategory::Input, "--session cannot be empty", "missing_value"};
            }
            req.session_id = raw.session.value();
        }

        if (req.command != CommandKind::LoopSetup) {
            if (raw.max_iterations) return not_for_command("--max-iterations", req.command);
            if (raw.completion_promise) return not_for_command("--completion-promise", req.command);
            if (raw.task) return not_for_command("--task", req.command);
            return req;
        }

        if (!raw.max_iterations) {
            return GateError{ErrorCategory::Input, "loop-setup requires --max-iterations",
                             "missing_required_flag", "Provide a positive integer."};
        }

        // Exception-free integer parsing
        uint32_t iterations = 0;
        const char* begin = raw.max_iterations->data();
        const char* end = raw.max_iterations->data() + raw.max_iterations->size();
        auto [ptr, ec] = std::from_chars(begin, end, iterations);
        if (ec != std::errc() || ptr != end || begin == end) {
            return GateError{ErrorCategory::Input, "Invalid number for --max-iterations", "invalid_integer", "Provide a positive integer."};
        }
        if (iterations == 0 || iterations > 10000) {
            return GateError{ErrorCategory::Input, "--max-iterations out of bounds", "bounds_error", "Must be between 1 and 10000."};
        }
        req.max_iterations = iterations;

        if (raw.completion_promise) {
            if (raw.completion_promise->empty() ||
                raw.completion_promise->find('\n') != std::string::npos) {
                return GateError{ErrorCategory::Input, "Invalid --completion-promise",
                                 "invalid_completion_token", "Use a non-empty single-line token."};
            }
            req.completion_token = raw.completion_promise.value();
        }
        if (raw.task) {
            req.task_text = raw.task.value();
        }

        return req;
    }

} // namespace hookgate::app::cli
