#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "session/loop_state.hpp"
#include "session/loop_state_store.hpp"

namespace hookgate::session {

enum class StopAction {
    AllowExit,
    BlockExit  // host keeps the session alive and re-presents the task
};

struct SetupRequest {
    std::string session_id;
    std::uint32_t max_iterations = 0;
    std::optional<std::string> completion_token;
    std::string task_text;
};

struct SetupResult {
    bool created = false;  // false: an active loop already existed, nothing changed
    LoopState state;
    std::string message;
};

struct CancelResult {
    bool cancelled = false;
    std::optional<LoopState> state;
    std::string message;
};

struct StopOutcome {
    StopAction action = StopAction::AllowExit;
    LoopPhase phase = LoopPhase::NoLoop;
    bool transitioned = false;
    std::string session_key;  // state record the outcome was computed from
    std::optional<LoopState> state;
    std::string message;       // operator-facing summary
    std::string continuation;  // next agent input when action == BlockExit
};

// Loop state machine:
//   NoLoop --setup--> Active --stop w/o token, iteration < max--> Active (iteration + 1)
//   Active --stop with <promise>token</promise>--> CompletedByPromise
//   Active --stop w/o token, iteration >= max--> CompletedByBudget
//   Active --cancel--> Cancelled
// Every transition is durable before the call returns.
class IterationController {
public:
    IterationController(LoopStateStore store, std::string default_completion_token);

    core::errors::Result<SetupResult> setup(const SetupRequest& request);
    core::errors::Result<CancelResult> cancel(const std::string& session_id);
    core::errors::Result<std::optional<LoopState>> status(const std::string& session_id) const;

    // SessionStop only. A session without its own record falls back to the
    // "default" record, which binds to the first session that stops on it;
    // stops from other sessions leave a bound record untouched.
    core::errors::Result<StopOutcome> on_stop(const std::string& session_id,
                                              const std::string& last_output);

    const LoopStateStore& store() const { return store_; }

    // True when some <promise>...</promise> span, whitespace-normalized,
    // equals the token exactly.
    static bool contains_promise(const std::string& output, const std::string& token);

    static std::string normalize_token(const std::string& token);

    static std::string continuation_message(const LoopState& state);

private:
    std::string resolve_session_key(const std::string& session_id) const;

    LoopStateStore store_;
    std::string default_completion_token_;
};

}  // namespace hookgate::session
