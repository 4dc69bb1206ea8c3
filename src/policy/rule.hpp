#pragma once

#include <regex>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace hookgate::policy {

enum class RuleKind {
    Block,
    AllowException
};

enum class PatternSyntax {
    Regex,  // ECMAScript, searched anywhere in the candidate
    Glob    // whole-candidate match, '/' separated
};

enum class CaseMode {
    Sensitive,
    Insensitive
};

// One operator-editable rule as it appears in configuration.
struct Rule {
    std::string category;
    RuleKind kind = RuleKind::Block;
    std::string pattern;
    std::string reason;
    PatternSyntax syntax = PatternSyntax::Regex;
};

struct CompiledRule {
    Rule rule;
    std::regex matcher;
};

using RuleSet = std::vector<CompiledRule>;

// The only place a pattern can be invalid. Run once at startup.
core::errors::Result<RuleSet> compile_rules(const std::vector<Rule>& rules,
                                            CaseMode case_mode);

// Glob -> ECMAScript regex source. '**' crosses '/', '*' and '?' do not,
// and a leading '**/' also matches zero directories.
std::string glob_to_regex(const std::string& glob);

std::string to_string(RuleKind kind);

}  // namespace hookgate::policy
