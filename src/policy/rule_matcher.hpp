#pragma once

#include <string>
#include "policy/rule.hpp"
#include "protocol/verdict.hpp"

namespace hookgate::policy {

// Evaluates an ordered rule set against one candidate string.
//
// Block rules are scanned in declaration order. A matching block rule is
// suppressed when any AllowException rule of the same category also matches,
// wherever that exception is declared; scanning then continues with the next
// block rule. The first block rule that is not suppressed decides.
// Case sensitivity is fixed when the rule set is compiled.
//
// Pure and total: no I/O, never throws.
protocol::Verdict evaluate(const std::string& candidate, const RuleSet& rules);

}  // namespace hookgate::policy
