#include "policy/command_guard.hpp"

#include <cctype>
#include <utility>
#include "policy/rule_matcher.hpp"

namespace hookgate::policy {

using protocol::Verdict;

namespace {

Rule block(const char* category, const char* pattern, const char* reason) {
    return Rule{category, RuleKind::Block, pattern, reason, PatternSyntax::Regex};
}

Rule exception(const char* category, const char* pattern, const char* reason) {
    return Rule{category, RuleKind::AllowException, pattern, reason,
                PatternSyntax::Regex};
}

}  // namespace

std::vector<Rule> default_command_rules() {
    using namespace command_category;
    return {
        // Destructive filesystem operations
        block(kDestructive,
              R"re(\brm\s+(?:-\S*\s+)*(?:-[a-z]*r[a-z]*\b|--recursive\b))re",
              "Recursive delete (rm -r) can destroy data irrecoverably."),
        block(kDestructive, R"re(\bdd\b[^;&|]*\bof=/dev/)re",
              "Low-level disk write (dd of=/dev/...) can corrupt a device."),
        block(kDestructive, R"re(>\s*/dev/(?:sd|hd|vd|xvd|nvme|mmcblk|disk))re",
              "Redirecting output onto a block device overwrites it."),
        block(kDestructive, R"re(\b(?:mkfs(?:\.[a-z0-9]+)?|wipefs)\b)re",
              "Filesystem formatting erases the target device."),

        // Privilege escalation, also when quoted, grouped, negated, inside a
        // then/do/else body or called by absolute path
        block(kPrivilegeEscalation,
              R"re((?:^|[;&|(\x60'"{!]\s*|\b(?:then|do|else)\s+)(?:(?:/[\w.-]+)*/)?(?:sudo|doas|pkexec)\b)re",
              "Superuser invocation is not allowed from the agent."),
        block(kPrivilegeEscalation,
              R"re(\b(?:xargs|env|nohup|exec|time)\s+(?:-\S+\s+)*(?:(?:/[\w.-]+)*/)?(?:sudo|doas)\b)re",
              "Superuser invocation is not allowed from the agent."),
        block(kPrivilegeEscalation,
              R"re((?:^|[;&|(\x60'"{!]\s*|\b(?:then|do|else)\s+)(?:(?:/[\w.-]+)*/)?su(?:\s|$))re",
              "Switching to another user (su) is not allowed from the agent."),

        // Remote code execution
        block(kRemoteCodeExecution,
              R"re(\b(?:curl|wget|fetch)\b[^;&|]*\|\s*(?:sudo\s+)?(?:env\s+)?(?:ba|z|k|da|fi)?sh\b)re",
              "Piping downloaded content into a shell executes unreviewed remote code."),
        block(kRemoteCodeExecution,
              R"re(\b(?:curl|wget)\b[^;&|]*\|\s*(?:sudo\s+)?(?:python[0-9.]*|perl|ruby|node|php)\b)re",
              "Piping downloaded content into an interpreter executes unreviewed remote code."),
        block(kRemoteCodeExecution,
              R"re((?:\b(?:ba|z|da)?sh|\bsource)\s+(?:-c\s+)?["']?(?:<\(|\$\()\s*(?:curl|wget)\b)re",
              "Executing the output of a download executes unreviewed remote code."),
        block(kRemoteCodeExecution,
              R"re(\bbase64\s+(?:-d|-D|--decode)\b[^;&]*\|\s*(?:sudo\s+)?(?:ba|z|da)?sh\b)re",
              "Executing a base64-decoded payload hides what actually runs."),
        block(kRemoteCodeExecution,
              R"re(\beval\b[^;&]*\$\([^)]*(?:base64|xxd|openssl\s+enc|curl|wget))re",
              "Evaluating a decoded or downloaded payload hides what actually runs."),

        // Supply chain
        block(kSupplyChain,
              R"re(\b(?:npx|bunx|pnpm\s+dlx|yarn\s+dlx)\s+(?:--?[a-z][a-z-]*\s+)*(?:@[^\s/@]+/)?[^\s@/-][^\s@]*(?:\s|$))re",
              "Ad hoc execution of an unpinned package (pin it as name@version)."),
        block(kSupplyChain,
              R"re(\b(?:pip3?|uv\s+pip|npm|pnpm|yarn|bun|gem|go)\s+(?:install|add|i|get)\b[^;&|]*\s(?:git\+)?(?:https?|ssh|ftp)://)re",
              "Installing a package from an arbitrary URL bypasses the registry."),
        block(kSupplyChain, R"re(\bcargo\s+install\b[^;&|]*\s--git\b)re",
              "Installing a package from an arbitrary URL bypasses the registry."),

        // Version-control safety
        block(kVersionControl,
              R"re(\bgit\s+push\b[^;&|]*\s(?:--force(?:-with-lease)?|-f)(?:[\s=]|$))re",
              "Force-push rewrites shared history."),
        block(kVersionControl, R"re(\bgit\s+push\b[^;&|]*\s\+\S+)re",
              "Force-push rewrites shared history."),
        block(kVersionControl,
              R"re(\bgit\s+push\b[^;&|]*\s(?:[^\s:]*:)?(?:refs/heads/)?(?:main|master|production|release)(?:\s|$))re",
              "Pushing directly to a protected branch is not allowed."),
        block(kVersionControl, R"re(\bgit\s+commit\b[^;&|]*co-authored-by\s*:)re",
              "Commit injects a co-author trailer the operator did not write."),

        // Category-scoped exceptions. Each covers one whole segment; the
        // formatter one refuses pipes, backgrounding and substitutions.
        exception(kDestructive,
                  R"re(^rm\s+-(?:rf|fr|r)\s+(?:\./)?(?:node_modules|dist|build|target|coverage|\.cache|__pycache__|\.pytest_cache)/?$)re",
                  "Removing a generated build directory."),
        exception(kSupplyChain,
                  R"re(^npx\s+(?:--no-install\s+)?(?:prettier|eslint|tsc)(?:\s(?:(?![|&\x60]|\$\().)*)?$)re",
                  "Known formatter or linter invocation."),
    };
}

CommandGuard::CommandGuard(RuleSet rules) : rules_(std::move(rules)) {}

core::errors::Result<CommandGuard> CommandGuard::create(const std::vector<Rule>& rules) {
    auto compiled = compile_rules(rules, CaseMode::Insensitive);
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    return CommandGuard(std::move(std::get<RuleSet>(compiled)));
}

std::string CommandGuard::normalize(const std::string& command) {
    std::string out;
    out.reserve(command.size());
    bool pending_space = false;
    for (const unsigned char c : command) {
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

std::vector<std::string> CommandGuard::split_segments(const std::string& command) {
    std::vector<std::string> segments;
    std::string current;
    auto flush = [&]() {
        std::string segment = normalize(current);
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
        current.clear();
    };

    char quote = '\0';
    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        const char next = i + 1 < command.size() ? command[i + 1] : '\0';
        if (quote != '\0') {
            current.push_back(c);
            if (c == '\\' && quote == '"' && next != '\0') {
                current.push_back(next);
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && next != '\0') {
            current.push_back(c);
            current.push_back(next);
            ++i;
        } else if (c == '\'' || c == '"') {
            quote = c;
            current.push_back(c);
        } else if (c == ';' || c == '\n') {
            flush();
        } else if ((c == '&' && next == '&') || (c == '|' && next == '|')) {
            flush();
            ++i;
        } else {
            current.push_back(c);
        }
    }
    flush();
    return segments;
}

Verdict CommandGuard::check(const std::string& command) const {
    const std::string normalized = normalize(command);
    if (normalized.empty()) {
        return Verdict::allow("Empty command; nothing to evaluate.");
    }
    if (normalized.size() > kMaxCommandLength) {
        return Verdict::block("Command too long to evaluate (" +
                                  std::to_string(normalized.size()) + " characters, limit " +
                                  std::to_string(kMaxCommandLength) + ").",
                              command_category::kOversized, "");
    }

    // Exceptions are anchored to a whole command, so a chain is judged one
    // segment at a time; any blocked segment blocks the chain.
    const auto segments = split_segments(command);
    if (segments.size() < 2) {
        return evaluate(normalized, rules_);
    }
    for (const auto& segment : segments) {
        Verdict verdict = evaluate(segment, rules_);
        if (verdict.blocked()) {
            return verdict;
        }
    }
    return Verdict::allow();
}

}  // namespace hookgate::policy
