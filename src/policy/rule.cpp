#include "policy/rule.hpp"

#include <utility>

namespace hookgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

std::string glob_to_regex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            const bool double_star = i + 1 < glob.size() && glob[i + 1] == '*';
            if (!double_star) {
                out += "[^/]*";
                continue;
            }
            const bool at_segment_start = i == 0 || glob[i - 1] == '/';
            const bool slash_follows = i + 2 < glob.size() && glob[i + 2] == '/';
            if (at_segment_start && slash_follows) {
                out += "(?:.*/)?";
                i += 2;
            } else {
                out += ".*";
                i += 1;
            }
            continue;
        }
        if (c == '?') {
            out += "[^/]";
            continue;
        }
        switch (c) {
            case '.': case '+': case '(': case ')': case '[': case ']':
            case '{': case '}': case '^': case '$': case '|': case '\\':
                out.push_back('\\');
                break;
            default:
                break;
        }
        out.push_back(c);
    }
    return "^" + out + "$";
}

core::errors::Result<RuleSet> compile_rules(const std::vector<Rule>& rules,
                                            const CaseMode case_mode) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (case_mode == CaseMode::Insensitive) {
        flags |= std::regex::icase;
    }

    RuleSet compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        if (rule.pattern.empty()) {
            return GateError{ErrorCategory::Configuration,
                             "Rule in category '" + rule.category + "' has an empty pattern.",
                             "invalid_rule_pattern"};
        }
        if (rule.category.empty()) {
            return GateError{ErrorCategory::Configuration,
                             "Rule '" + rule.pattern + "' has no category.",
                             "invalid_rule_pattern"};
        }

        const std::string source = rule.syntax == PatternSyntax::Glob
                                       ? glob_to_regex(rule.pattern)
                                       : rule.pattern;
        try {
            compiled.push_back(CompiledRule{rule, std::regex(source, flags)});
        } catch (const std::regex_error& e) {
            return GateError{ErrorCategory::Configuration,
                             "Invalid pattern '" + rule.pattern + "' in category '" +
                                 rule.category + "': " + e.what(),
                             "invalid_rule_pattern",
                             "Fix the pattern in the rule configuration."};
        }
    }
    return compiled;
}

std::string to_string(const RuleKind kind) {
    switch (kind) {
        case RuleKind::Block:
            return "block";
        case RuleKind::AllowException:
            return "allow";
        default:
            return "unknown";
    }
}

}  // namespace hookgate::policy
