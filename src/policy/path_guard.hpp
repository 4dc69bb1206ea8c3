#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "policy/rule.hpp"
#include "protocol/verdict.hpp"

namespace hookgate::policy {

// A protected glob and the exception globs that override it.
struct ProtectedPath {
    std::string pattern;
    std::vector<std::string> exceptions;
    std::string reason;
};

struct PathPolicy {
    std::vector<ProtectedPath> protected_paths;
    std::vector<std::string> exceptions;       // applies to every protected glob
    std::vector<std::string> content_markers;  // literal, case-sensitive
};

PathPolicy default_path_policy();

// Two OR-combined checks on a proposed file write:
//  - path check: protected globs, overridden by exception globs on that path
//  - content check: sentinel markers anywhere in the new content; no exception
//    overrides it
// The operator override disables both (and is logged every time it applies).
class PathGuard {
public:
    static core::errors::Result<PathGuard> create(const PathPolicy& policy,
                                                  bool override_enabled = false);

    protocol::Verdict check(const std::string& target_path, const std::string& content,
                            const std::filesystem::path& project_root = {}) const;

    bool override_enabled() const { return override_enabled_; }

    // Project-relative generic form when the target is under project_root,
    // otherwise the lexically normalized path as given.
    static std::string candidate_path(const std::string& target_path,
                                      const std::filesystem::path& project_root);

private:
    PathGuard(RuleSet rules, std::vector<std::string> markers, bool override_enabled);

    RuleSet rules_;
    std::vector<std::string> markers_;
    bool override_enabled_ = false;
};

namespace path_check {
inline constexpr const char* kPath = "path_check";
inline constexpr const char* kContent = "content_check";
inline constexpr const char* kOversized = "oversized_input";
}  // namespace path_check

// Longest target path handed to the glob matcher; longer paths are blocked.
inline constexpr std::size_t kMaxPathLength = 4096;

}  // namespace hookgate::policy
