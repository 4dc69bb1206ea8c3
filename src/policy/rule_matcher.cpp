#include "policy/rule_matcher.hpp"

namespace hookgate::policy {

using protocol::Verdict;

namespace {

// A rule that cannot be evaluated (regex_error at match time) counts as
// matched for Block rules and unmatched for exceptions.
bool matches(const CompiledRule& compiled, const std::string& candidate) {
    try {
        if (compiled.rule.syntax == PatternSyntax::Glob) {
            return std::regex_match(candidate, compiled.matcher);
        }
        return std::regex_search(candidate, compiled.matcher);
    } catch (const std::regex_error&) {
        return compiled.rule.kind == RuleKind::Block;
    }
}

bool exempted(const std::string& category, const std::string& candidate,
              const RuleSet& rules) {
    for (const auto& compiled : rules) {
        if (compiled.rule.kind != RuleKind::AllowException ||
            compiled.rule.category != category) {
            continue;
        }
        if (matches(compiled, candidate)) {
            return true;
        }
    }
    return false;
}

}  // namespace

Verdict evaluate(const std::string& candidate, const RuleSet& rules) {
    for (const auto& compiled : rules) {
        if (compiled.rule.kind != RuleKind::Block) {
            continue;
        }
        if (!matches(compiled, candidate)) {
            continue;
        }
        if (exempted(compiled.rule.category, candidate, rules)) {
            continue;
        }
        return Verdict::block(compiled.rule.reason, compiled.rule.category,
                              compiled.rule.pattern);
    }
    return Verdict::allow();
}

}  // namespace hookgate::policy
