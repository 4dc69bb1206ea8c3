#include "runtime/hook_dispatcher.hpp"

#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/envelope_parser.hpp"

namespace hookgate::runtime {

using core::errors::ErrorCategory;
using protocol::Decision;
using protocol::HookEvent;
using protocol::HookEventKind;
using protocol::Operation;
using protocol::Verdict;

namespace {

// A malformed envelope is gated by the failure policy unless we can still
// tell it was not a PreToolUse event.
bool may_be_pre_invocation(const std::string& raw_envelope) {
    const auto envelope = nlohmann::json::parse(raw_envelope, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return true;
    }
    const auto name = envelope.find("hook_event_name");
    if (name == envelope.end() || !name->is_string()) {
        return true;
    }
    return name->get<std::string>() == "PreToolUse";
}

std::string envelope_session(const std::string& raw_envelope) {
    const auto envelope = nlohmann::json::parse(raw_envelope, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return "";
    }
    const auto session = envelope.find("session_id");
    if (session == envelope.end() || !session->is_string()) {
        return "";
    }
    return session->get<std::string>();
}

}  // namespace

std::string summarize(const HookEvent& event) {
    if (const auto* command = std::get_if<protocol::CommandPayload>(&event.payload)) {
        return command->command;
    }
    if (const auto* write = std::get_if<protocol::FileWritePayload>(&event.payload)) {
        return event.tool_name + " " + write->path;
    }
    switch (event.kind) {
        case HookEventKind::PromptSubmitted:
        case HookEventKind::Notification:
            return event.text;
        case HookEventKind::SessionStop:
        case HookEventKind::SubagentStop:
            return protocol::to_string(event.kind);
        default:
            return event.tool_name;
    }
}

session::AuditConcern concern_for(const HookEvent& event) {
    switch (event.kind) {
        case HookEventKind::PromptSubmitted:
            return session::AuditConcern::Prompts;
        case HookEventKind::SessionStop:
        case HookEventKind::SubagentStop:
            return session::AuditConcern::LoopTransitions;
        default:
            break;
    }
    switch (event.operation) {
        case Operation::RunShellCommand:
            return session::AuditConcern::Commands;
        case Operation::WriteFile:
        case Operation::EditFile:
            return session::AuditConcern::FileEdits;
        default:
            return session::AuditConcern::Lifecycle;
    }
}

HookDispatcher::HookDispatcher(core::errors::Result<policy::GuardSet> guards,
                               session::IterationController controller,
                               session::AuditSink audit,
                               const core::config::FailurePolicy failure_policy,
                               std::filesystem::path project_dir)
    : controller_(std::move(controller)),
      audit_(std::move(audit)),
      failure_policy_(failure_policy),
      project_dir_(std::move(project_dir)) {
    if (core::errors::is_error(guards)) {
        guard_error_ = core::errors::get_error(guards);
        HOOKGATE_LOG_ERROR("HookDispatcher: guards unavailable [" + guard_error_->code +
                           "]: " + guard_error_->message);
    } else {
        guards_.emplace(std::move(std::get<policy::GuardSet>(guards)));
    }
}

DispatchResult HookDispatcher::decide_guard_failure(const std::string& what) const {
    DispatchResult result;
    if (failure_policy_ == core::config::FailurePolicy::Closed) {
        result.status = DispatchStatus::Block;
        result.decision = Decision::Block;
        result.reason = "hookgate: " + what + " (fail-closed).";
    } else {
        result.reason = "hookgate: " + what + " (fail-open).";
    }
    result.category = "gate_failure";
    return result;
}

DispatchResult HookDispatcher::decide_pre_invocation(const HookEvent& event) const {
    std::vector<Verdict> verdicts;
    if (event.operation == Operation::RunShellCommand ||
        event.operation == Operation::WriteFile || event.operation == Operation::EditFile) {
        if (!guards_.has_value()) {
            return decide_guard_failure("rule configuration error, " + guard_error_->message);
        }
    }

    if (const auto* command = std::get_if<protocol::CommandPayload>(&event.payload)) {
        verdicts.push_back(guards_->command.check(command->command));
    } else if (const auto* write = std::get_if<protocol::FileWritePayload>(&event.payload)) {
        verdicts.push_back(guards_->path.check(write->path, write->content, project_dir_));
    }

    DispatchResult result;
    for (const auto& verdict : verdicts) {
        if (verdict.blocked()) {
            result.status = DispatchStatus::Block;
            result.decision = Decision::Block;
            result.category = verdict.category;
            result.reason = "hookgate blocked " + protocol::to_string(event.operation) +
                            " [" + verdict.category + "]: " + verdict.reason;
            return result;
        }
        if (result.reason.empty()) {
            result.reason = verdict.reason;
        }
    }
    return result;
}

DispatchResult HookDispatcher::decide_stop(const HookEvent& event) {
    std::string output;
    if (event.last_output.has_value()) {
        output = *event.last_output;
    } else if (event.transcript_path.has_value()) {
        auto text = protocol::read_last_assistant_text(*event.transcript_path);
        if (core::errors::is_error(text)) {
            HOOKGATE_LOG_WARN("HookDispatcher: " + core::errors::get_error(text).message +
                              "; treating the output as empty");
        } else {
            output = core::errors::get_value(text);
        }
    }

    DispatchResult result;
    auto outcome = controller_.on_stop(event.session_id, output);
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        if (err.category == ErrorCategory::Persistence) {
            result.status = DispatchStatus::PersistenceFailure;
            result.reason = "hookgate: loop state was not saved [" + err.code +
                            "]: " + err.message;
            result.category = "persistence_failure";
            HOOKGATE_LOG_ERROR(result.reason);
            return result;
        }
        result.reason = "hookgate: loop state unusable [" + err.code + "]: " + err.message +
                        " (fail-open, session may end).";
        result.category = "loop_configuration_error";
        HOOKGATE_LOG_ERROR(result.reason);
        return result;
    }

    const auto& stop = core::errors::get_value(outcome);
    result.category = session::to_string(stop.phase);
    if (stop.action == session::StopAction::BlockExit) {
        result.status = DispatchStatus::Block;
        result.decision = Decision::Block;
        result.reason = stop.continuation;
    } else {
        result.reason = stop.message;
    }
    return result;
}

void HookDispatcher::record(const HookEvent& event, DispatchResult& result) const {
    const std::string reason =
        protocol::is_stop(event.kind) && result.decision == Decision::Block
            ? result.category + ": " + result.reason.substr(0, result.reason.find('\n'))
            : result.reason;
    auto written = audit_.append(
        concern_for(event),
        session::make_audit_entry(event.session_id, protocol::to_string(event.kind),
                                  summarize(event), result.decision, reason));
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        HOOKGATE_LOG_ERROR("HookDispatcher: audit write failed [" + err.code + "]: " +
                           err.message);
        return;
    }
    result.audit_written = true;
}

void HookDispatcher::record_failure(const std::string& raw_envelope,
                                    DispatchResult& result) const {
    auto written = audit_.append(
        session::AuditConcern::Lifecycle,
        session::make_audit_entry(result.session_id, "envelope_parse_failure",
                                  raw_envelope, result.decision, result.reason));
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        HOOKGATE_LOG_ERROR("HookDispatcher: audit write failed [" + err.code + "]: " +
                           err.message);
        return;
    }
    result.audit_written = true;
}

DispatchResult HookDispatcher::dispatch(const std::string& raw_envelope) {
    auto parsed = protocol::parse_envelope(raw_envelope);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        const std::string what = "could not parse hook input [" + err.code + "]: " +
                                 err.message;
        DispatchResult result;
        if (may_be_pre_invocation(raw_envelope)) {
            result = decide_guard_failure(what);
        } else {
            result.reason = "hookgate: " + what + " (fail-open).";
            result.category = "gate_failure";
        }
        result.session_id = envelope_session(raw_envelope);
        result.stage = DispatchStage::Failed;
        HOOKGATE_LOG_WARN("HookDispatcher: " + result.reason);
        record_failure(raw_envelope, result);
        return result;
    }
    return dispatch(core::errors::get_value(parsed));
}

DispatchResult HookDispatcher::dispatch(const HookEvent& event) {
    core::logging::Logger::get().set_session_id(event.session_id);
    HOOKGATE_LOG_DEBUG("HookDispatcher: received " + protocol::to_string(event.kind) +
                       " (" + protocol::to_string(event.operation) + ")");

    DispatchResult result;
    switch (event.kind) {
        case HookEventKind::PreInvocation:
            result = decide_pre_invocation(event);
            break;
        case HookEventKind::SessionStop:
            result = decide_stop(event);
            break;
        case HookEventKind::SubagentStop:
            // Subagents share the parent's session id; only the parent's stop
            // counts against the loop.
            result.reason = "Subagent stop; loop state unchanged.";
            result.category = "subagent_stop";
            break;
        case HookEventKind::PostInvocation:
        case HookEventKind::PostInvocationFailure:
        case HookEventKind::PromptSubmitted:
        case HookEventKind::Notification:
        default:
            break;
    }
    result.kind = event.kind;
    result.session_id = event.session_id;
    result.stage = DispatchStage::Decided;

    if (result.decision == Decision::Block) {
        HOOKGATE_LOG_INFO("HookDispatcher: block " + protocol::to_string(event.kind) + " [" +
                          result.category + "]");
    }

    // Audit strictly after the decision is final.
    record(event, result);
    result.stage = DispatchStage::Logged;

    result.stage = DispatchStage::Returned;
    return result;
}

}  // namespace hookgate::runtime
