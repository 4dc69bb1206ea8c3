#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "core/config/gate_config.hpp"

namespace hookgate::protocol {

    enum class CommandKind {
        Hook,        // one host event on stdin
        LoopSetup,
        LoopCancel,
        LoopStatus,
        Doctor
    };

    // Validated command-line input
    struct GateRequest {
        CommandKind command = CommandKind::Hook;
        core::config::ConfigOverrides overrides;
        std::optional<std::string> session_id;
        std::uint32_t max_iterations = 0;
        std::optional<std::string> completion_token;
        std::optional<std::string> task_text;  // nullopt: read from stdin
    };

    inline std::string to_string(const CommandKind command) {
        switch (command) {
            case CommandKind::Hook:       return "hook";
            case CommandKind::LoopSetup:  return "loop-setup";
            case CommandKind::LoopCancel: return "loop-cancel";
            case CommandKind::LoopStatus: return "loop-status";
            case CommandKind::Doctor:     return "doctor";
            default: return "unknown";
        }
    }

} // namespace hookgate::protocol
