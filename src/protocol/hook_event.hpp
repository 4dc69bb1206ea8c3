#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace hookgate::protocol {

    // Lifecycle points the host reports to us
    enum class HookEventKind {
        PreInvocation,
        PostInvocation,
        PostInvocationFailure,
        PromptSubmitted,
        SessionStop,
        SubagentStop,
        Notification
    };

    // What a Pre/Post-Invocation event is about
    enum class Operation {
        None,
        RunShellCommand,
        WriteFile,
        EditFile,
        Other
    };

    struct CommandPayload {
        std::string command;
    };

    struct FileWritePayload {
        std::string path;
        std::string content;  // proposed new text (Write content or Edit replacement)
    };

    using OperationPayload =
        std::variant<std::monostate, CommandPayload, FileWritePayload>;

    struct HookEvent {
        HookEventKind kind = HookEventKind::Notification;
        std::string session_id;
        std::optional<std::filesystem::path> cwd;

        // Pre/Post-Invocation only
        Operation operation = Operation::None;
        std::string tool_name;
        OperationPayload payload;

        // PromptSubmitted / Notification
        std::string text;

        // SessionStop / SubagentStop
        std::optional<std::string> last_output;
        std::optional<std::filesystem::path> transcript_path;
    };

    inline bool is_stop(const HookEventKind kind) {
        return kind == HookEventKind::SessionStop || kind == HookEventKind::SubagentStop;
    }

    inline std::string to_string(const HookEventKind kind) {
        switch (kind) {
            case HookEventKind::PreInvocation:         return "pre_invocation";
            case HookEventKind::PostInvocation:        return "post_invocation";
            case HookEventKind::PostInvocationFailure: return "post_invocation_failure";
            case HookEventKind::PromptSubmitted:       return "prompt_submitted";
            case HookEventKind::SessionStop:           return "session_stop";
            case HookEventKind::SubagentStop:          return "subagent_stop";
            case HookEventKind::Notification:          return "notification";
            default: return "unknown";
        }
    }

    inline std::string to_string(const Operation operation) {
        switch (operation) {
            case Operation::None:            return "none";
            case Operation::RunShellCommand: return "run_shell_command";
            case Operation::WriteFile:       return "write_file";
            case Operation::EditFile:        return "edit_file";
            case Operation::Other:           return "other";
            default: return "unknown";
        }
    }

    // Host event names as they appear in the envelope's "hook_event_name"
    inline std::optional<HookEventKind> parse_event_kind(const std::string& host_name) {
        if (host_name == "PreToolUse")         return HookEventKind::PreInvocation;
        if (host_name == "PostToolUse")        return HookEventKind::PostInvocation;
        if (host_name == "PostToolUseFailure") return HookEventKind::PostInvocationFailure;
        if (host_name == "UserPromptSubmit")   return HookEventKind::PromptSubmitted;
        if (host_name == "Stop")               return HookEventKind::SessionStop;
        if (host_name == "SubagentStop")       return HookEventKind::SubagentStop;
        if (host_name == "Notification")       return HookEventKind::Notification;
        return std::nullopt;
    }

} // namespace hookgate::protocol
