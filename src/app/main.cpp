#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/commands.hpp"
#include "app/exit_codes.hpp"
#include "core/config/gate_config.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    using hookgate::protocol::CommandKind;
    namespace errors = hookgate::core::errors;
    auto& logger = hookgate::core::logging::Logger::get();

    // 1. Parse CLI input; misuse is reported on stderr
    logger.set_stream(std::cerr);
    auto parsed = hookgate::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        HOOKGATE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            HOOKGATE_LOG_INFO("Hint: " + err.hint);
        }
        return hookgate::app::kExitUsage;
    }
    const auto& req = errors::get_value(parsed);
    const bool hook_mode = req.command == CommandKind::Hook;

    // 2. Resolve configuration
    auto loaded = hookgate::core::config::load_config(req.overrides);
    if (errors::is_error(loaded)) {
        const auto& err = errors::get_error(loaded);
        HOOKGATE_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (hook_mode) {
            // No policy could be read; never take the host down with us.
            std::cerr << "hookgate: configuration error, allowing (fail-open): " << err.message
                      << "\n";
            return hookgate::app::kExitOk;
        }
        return hookgate::app::kExitUsage;
    }
    const auto& config = errors::get_value(loaded);

    // 3. Route diagnostics. In hook mode stderr belongs to the host.
    logger.set_min_level(config.log_level);
    if (hook_mode) {
        if (!logger.set_file(config.log_dir / "hookgate.log")) {
            logger.set_min_level(hookgate::core::logging::LogLevel::ERROR);
        }
    } else {
        logger.set_stream(std::cout);
    }

    // 4. Run the command
    switch (req.command) {
        case CommandKind::Hook:
            return hookgate::app::run_hook(config, std::cin, std::cerr);
        case CommandKind::LoopSetup:
            return hookgate::app::run_loop_setup(config, req, std::cin, std::cout, std::cerr);
        case CommandKind::LoopCancel:
            return hookgate::app::run_loop_cancel(config, req, std::cout, std::cerr);
        case CommandKind::LoopStatus:
            return hookgate::app::run_loop_status(config, req, std::cout, std::cerr);
        case CommandKind::Doctor:
            return hookgate::app::run_doctor(config, std::cout);
        default:
            HOOKGATE_LOG_ERROR("Unhandled command: " + hookgate::protocol::to_string(req.command));
            return hookgate::app::kExitUsage;
    }
}
