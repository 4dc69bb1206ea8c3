#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "policy/rule.hpp"
#include "protocol/verdict.hpp"

namespace hookgate::policy {

namespace command_category {
inline constexpr const char* kDestructive = "destructive";
inline constexpr const char* kPrivilegeEscalation = "privilege_escalation";
inline constexpr const char* kRemoteCodeExecution = "remote_code_execution";
inline constexpr const char* kSupplyChain = "supply_chain";
inline constexpr const char* kVersionControl = "version_control";
inline constexpr const char* kOversized = "oversized_input";
}  // namespace command_category

// std::regex matching recurses per input character, so longer candidates are
// refused before any pattern runs.
inline constexpr std::size_t kMaxCommandLength = 8192;

// Built-in denylist plus the category-scoped exceptions shipped with it.
std::vector<Rule> default_command_rules();

// Decides whether a proposed shell invocation may run. Pure classification;
// the caller logs.
class CommandGuard {
public:
    static core::errors::Result<CommandGuard> create(const std::vector<Rule>& rules);

    // Blocks a command whose normalized form exceeds kMaxCommandLength.
    protocol::Verdict check(const std::string& command) const;

    // Trims and collapses whitespace runs (newlines included) to one space.
    static std::string normalize(const std::string& command);

    // Splits on ';', '&&', '||' and newlines outside quotes. Pipes stay
    // inside a segment.
    static std::vector<std::string> split_segments(const std::string& command);

    std::size_t rule_count() const { return rules_.size(); }

private:
    explicit CommandGuard(RuleSet rules);

    RuleSet rules_;
};

}  // namespace hookgate::policy
