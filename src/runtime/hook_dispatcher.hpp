#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "policy/rule_loader.hpp"
#include "protocol/hook_event.hpp"
#include "protocol/verdict.hpp"
#include "session/audit_sink.hpp"
#include "session/iteration_controller.hpp"

namespace hookgate::runtime {

// Per-event lifecycle:
//   Received -> Parsed -> Decided -> Logged -> Returned
//   Received -> Failed  (envelope could not be parsed)
enum class DispatchStage {
    Received,
    Parsed,
    Decided,
    Logged,
    Returned,
    Failed
};

// What the outermost boundary turns into an exit status.
enum class DispatchStatus {
    Allow,
    Block,
    PersistenceFailure
};

struct DispatchResult {
    DispatchStatus status = DispatchStatus::Allow;
    protocol::Decision decision = protocol::Decision::Allow;
    std::string reason;  // surfaced to the host operator
    std::string category;
    std::optional<protocol::HookEventKind> kind;
    std::string session_id;
    DispatchStage stage = DispatchStage::Received;
    bool audit_written = false;
};

class HookDispatcher {
public:
    // `guards` may carry the startup ConfigurationError; the failure policy
    // then decides PreInvocation events.
    HookDispatcher(core::errors::Result<policy::GuardSet> guards,
                   session::IterationController controller, session::AuditSink audit,
                   core::config::FailurePolicy failure_policy,
                   std::filesystem::path project_dir);

    DispatchResult dispatch(const std::string& raw_envelope);
    DispatchResult dispatch(const protocol::HookEvent& event);

    const session::IterationController& controller() const { return controller_; }

private:
    DispatchResult decide_pre_invocation(const protocol::HookEvent& event) const;
    DispatchResult decide_stop(const protocol::HookEvent& event);
    DispatchResult decide_guard_failure(const std::string& what) const;
    void record(const protocol::HookEvent& event, DispatchResult& result) const;
    void record_failure(const std::string& raw_envelope, DispatchResult& result) const;

    std::optional<policy::GuardSet> guards_;
    std::optional<core::errors::GateError> guard_error_;
    session::IterationController controller_;
    session::AuditSink audit_;
    core::config::FailurePolicy failure_policy_;
    std::filesystem::path project_dir_;
};

// Operation summary used in audit records.
std::string summarize(const protocol::HookEvent& event);

session::AuditConcern concern_for(const protocol::HookEvent& event);

}  // namespace hookgate::runtime
