#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hookgate::session {

enum class LoopPhase {
    NoLoop,
    Active,
    CompletedByPromise,
    CompletedByBudget,
    Cancelled
};

namespace end_reason {
inline constexpr const char* kCompletionPromise = "completion_promise";
inline constexpr const char* kMaxIterations = "max_iterations";
inline constexpr const char* kUserCancelled = "user_cancelled";
}  // namespace end_reason

// Persisted iteration-control record. task_text never changes after setup.
struct LoopState {
    bool active = false;
    std::uint32_t iteration = 1;
    std::uint32_t max_iterations = 1;
    std::string completion_token;
    std::string task_text;
    std::string started_at;
    // Set on the "default" record by the first session that stops on it;
    // stops from any other session then leave the record alone.
    std::optional<std::string> bound_session;
    std::optional<std::string> ended_at;
    std::optional<std::string> end_reason;
};

inline LoopPhase phase_of(const std::optional<LoopState>& state) {
    if (!state.has_value()) {
        return LoopPhase::NoLoop;
    }
    if (state->active) {
        return LoopPhase::Active;
    }
    const std::string reason = state->end_reason.value_or("");
    if (reason == end_reason::kCompletionPromise) {
        return LoopPhase::CompletedByPromise;
    }
    if (reason == end_reason::kMaxIterations) {
        return LoopPhase::CompletedByBudget;
    }
    return LoopPhase::Cancelled;
}

inline std::string to_string(const LoopPhase phase) {
    switch (phase) {
        case LoopPhase::NoLoop:
            return "no_loop";
        case LoopPhase::Active:
            return "active";
        case LoopPhase::CompletedByPromise:
            return "completed_by_promise";
        case LoopPhase::CompletedByBudget:
            return "completed_by_budget";
        case LoopPhase::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

}  // namespace hookgate::session
