#include "session/iteration_controller.hpp"

#include <cctype>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "core/time_format.hpp"

namespace hookgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr const char* kPromiseOpen = "<promise>";
constexpr const char* kPromiseClose = "</promise>";
constexpr std::uint32_t kMaxIterationsCap = 10000;

std::string progress(const LoopState& state) {
    return std::to_string(state.iteration) + "/" + std::to_string(state.max_iterations);
}

}  // namespace

IterationController::IterationController(LoopStateStore store,
                                         std::string default_completion_token)
    : store_(std::move(store)),
      default_completion_token_(std::move(default_completion_token)) {}

std::string IterationController::normalize_token(const std::string& token) {
    std::string out;
    bool pending_space = false;
    for (const unsigned char c : token) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool IterationController::contains_promise(const std::string& output,
                                           const std::string& token) {
    const std::string open = kPromiseOpen;
    const std::string close = kPromiseClose;
    const std::string expected = normalize_token(token);
    if (expected.empty()) {
        return false;
    }

    // Each close tag pairs with the nearest open tag before it, so a stray
    // unclosed "<promise>" earlier in the output does not swallow a later span.
    std::size_t floor = 0;
    std::size_t end = output.find(close);
    while (end != std::string::npos) {
        const std::size_t start = output.rfind(open, end);
        if (start != std::string::npos && start >= floor) {
            const std::size_t body = start + open.size();
            if (body <= end &&
                normalize_token(output.substr(body, end - body)) == expected) {
                return true;
            }
        }
        floor = end + close.size();
        end = output.find(close, floor);
    }
    return false;
}

std::string IterationController::continuation_message(const LoopState& state) {
    return "hookgate loop iteration " + progress(state) + ": output " + kPromiseOpen +
           state.completion_token + kPromiseClose +
           " only when the task is truly complete.\n\n" + state.task_text;
}

std::string IterationController::resolve_session_key(const std::string& session_id) const {
    const std::string key = core::config::sanitize_session_id(session_id);
    std::error_code ec;
    if (std::filesystem::exists(store_.path_for(key), ec) || ec) {
        return key;
    }
    if (std::filesystem::exists(store_.path_for(core::config::kDefaultSessionId), ec)) {
        return std::string(core::config::kDefaultSessionId);
    }
    return key;
}

core::errors::Result<SetupResult> IterationController::setup(const SetupRequest& request) {
    if (request.max_iterations == 0 || request.max_iterations > kMaxIterationsCap) {
        return GateError{ErrorCategory::Input, "max_iterations out of bounds",
                         "bounds_error",
                         "Must be between 1 and " + std::to_string(kMaxIterationsCap) + "."};
    }
    if (normalize_token(request.task_text).empty()) {
        return GateError{ErrorCategory::Input, "Loop task text cannot be empty.",
                         "missing_task"};
    }
    const std::string token =
        normalize_token(request.completion_token.value_or(default_completion_token_));
    if (token.empty()) {
        return GateError{ErrorCategory::Input, "Completion token cannot be empty.",
                         "invalid_completion_token"};
    }

    const std::string key = core::config::sanitize_session_id(request.session_id);
    auto existing = store_.load(key);
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }
    const auto& current = core::errors::get_value(existing);
    if (current.has_value() && current->active) {
        SetupResult result;
        result.created = false;
        result.state = *current;
        result.message = "Loop already active for session " + key + " at iteration " +
                         progress(*current) + "; nothing changed.";
        HOOKGATE_LOG_INFO("IterationController: " + result.message);
        return result;
    }

    LoopState state;
    state.active = true;
    state.iteration = 1;
    state.max_iterations = request.max_iterations;
    state.completion_token = token;
    state.task_text = request.task_text;
    state.started_at = core::now_iso8601();

    auto saved = store_.save(key, state);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }

    const std::string prev = to_string(phase_of(current));
    HOOKGATE_LOG_INFO("IterationController: session " + key + " transition " + prev +
                      " -> active (max_iterations " + std::to_string(state.max_iterations) +
                      ")");

    SetupResult result;
    result.created = true;
    result.state = state;
    result.message = "Loop started for session " + key + ": iteration " + progress(state) +
                     ", finish by emitting " + kPromiseOpen + token + kPromiseClose + ".";
    return result;
}

core::errors::Result<CancelResult> IterationController::cancel(const std::string& session_id) {
    const std::string key = core::config::sanitize_session_id(session_id);
    auto loaded = store_.load(key);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }

    CancelResult result;
    result.state = core::errors::get_value(loaded);
    if (!result.state.has_value()) {
        result.message = "No loop recorded for session " + key + ".";
        return result;
    }
    if (!result.state->active) {
        result.message = "Loop for session " + key + " already ended (" +
                         to_string(phase_of(result.state)) + ").";
        return result;
    }

    LoopState state = *result.state;
    state.active = false;
    state.ended_at = core::now_iso8601();
    state.end_reason = end_reason::kUserCancelled;

    auto saved = store_.save(key, state);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    HOOKGATE_LOG_INFO("IterationController: session " + key +
                      " transition active -> cancelled at iteration " + progress(state));

    result.cancelled = true;
    result.state = state;
    result.message = "Cancelled loop for session " + key + " at iteration " +
                     progress(state) + ".";
    return result;
}

core::errors::Result<std::optional<LoopState>> IterationController::status(
    const std::string& session_id) const {
    return store_.load(core::config::sanitize_session_id(session_id));
}

core::errors::Result<StopOutcome> IterationController::on_stop(const std::string& session_id,
                                                               const std::string& last_output) {
    const std::string own_key = core::config::sanitize_session_id(session_id);
    StopOutcome outcome;
    outcome.session_key = resolve_session_key(session_id);

    auto loaded = store_.load(outcome.session_key);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    outcome.state = core::errors::get_value(loaded);
    outcome.phase = phase_of(outcome.state);
    if (outcome.phase != LoopPhase::Active) {
        outcome.action = StopAction::AllowExit;
        outcome.message = outcome.phase == LoopPhase::NoLoop
                              ? "No loop active."
                              : "Loop already ended (" + to_string(outcome.phase) + ").";
        return outcome;
    }

    LoopState state = *outcome.state;
    if (outcome.session_key != own_key) {
        // Borrowing the "default" record: the first session to stop on it owns it.
        if (!state.bound_session.has_value()) {
            state.bound_session = own_key;
            HOOKGATE_LOG_INFO("IterationController: default loop bound to session " + own_key);
        } else if (*state.bound_session != own_key) {
            outcome.phase = LoopPhase::NoLoop;
            outcome.action = StopAction::AllowExit;
            outcome.state.reset();
            outcome.message = "No loop active for session " + own_key +
                              " (the default loop belongs to session " +
                              *state.bound_session + ").";
            return outcome;
        }
    }

    if (contains_promise(last_output, state.completion_token)) {
        state.active = false;
        state.ended_at = core::now_iso8601();
        state.end_reason = end_reason::kCompletionPromise;
        outcome.phase = LoopPhase::CompletedByPromise;
        outcome.action = StopAction::AllowExit;
        outcome.message = "Loop completed: completion promise found at iteration " +
                          progress(state) + ".";
    } else if (state.iteration >= state.max_iterations) {
        state.active = false;
        state.ended_at = core::now_iso8601();
        state.end_reason = end_reason::kMaxIterations;
        outcome.phase = LoopPhase::CompletedByBudget;
        outcome.action = StopAction::AllowExit;
        outcome.message = "Loop gave up: iteration budget of " +
                          std::to_string(state.max_iterations) +
                          " exhausted without the completion promise.";
    } else {
        state.iteration += 1;
        outcome.phase = LoopPhase::Active;
        outcome.action = StopAction::BlockExit;
        outcome.message = "Loop continues: iteration " + progress(state) + ".";
        outcome.continuation = continuation_message(state);
    }

    auto saved = store_.save(outcome.session_key, state);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    HOOKGATE_LOG_INFO("IterationController: session " + outcome.session_key +
                      " transition active -> " + to_string(outcome.phase) +
                      " (iteration " + progress(state) + ")");

    outcome.transitioned = true;
    outcome.state = state;
    return outcome;
}

}  // namespace hookgate::session
