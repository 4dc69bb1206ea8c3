#pragma once

#include <string>
#include <utility>

namespace hookgate::protocol {

enum class Decision {
    Allow,
    Block
};

// Output of a guard. A Block always carries a non-empty reason.
struct Verdict {
    Decision decision = Decision::Allow;
    std::string reason;
    std::string category;  // rule category or check that fired
    std::string matched;   // pattern or marker that matched

    bool blocked() const { return decision == Decision::Block; }

    static Verdict allow(std::string reason = "") {
        Verdict verdict;
        verdict.reason = std::move(reason);
        return verdict;
    }

    static Verdict block(std::string reason, std::string category,
                         std::string matched) {
        Verdict verdict;
        verdict.decision = Decision::Block;
        verdict.category = std::move(category);
        verdict.matched = std::move(matched);
        verdict.reason = reason.empty()
                             ? "Blocked by " +
                                   (verdict.category.empty() ? std::string("policy")
                                                             : verdict.category) +
                                   " rule"
                             : std::move(reason);
        return verdict;
    }
};

inline std::string to_string(const Decision decision) {
    switch (decision) {
        case Decision::Allow:
            return "allow";
        case Decision::Block:
            return "block";
        default:
            return "unknown";
    }
}

}  // namespace hookgate::protocol
