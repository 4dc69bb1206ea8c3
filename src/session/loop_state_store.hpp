#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "session/loop_state.hpp"

namespace hookgate::session {

// One state file per session: <state_dir>/loop-<session>.md
//
//   ---
//   active: true
//   iteration: 2
//   max_iterations: 10
//   completion_token: DONE
//   started_at: 2026-10-19T08:15:00Z
//   ended_at:
//   end_reason:
//   ---
//   <task text, verbatim>
//
// Writes go to a temp file in the same directory, are fsync'd, then renamed
// over the record. A crash before the rename leaves the old record intact.
class LoopStateStore {
public:
    explicit LoopStateStore(std::filesystem::path state_dir);

    std::filesystem::path path_for(const std::string& session_id) const;

    // nullopt when the session has no record.
    core::errors::Result<std::optional<LoopState>> load(const std::string& session_id) const;

    core::errors::Result<std::filesystem::path> save(const std::string& session_id,
                                                     const LoopState& state) const;

    // The two halves of save(), exposed so a crash between them can be tested.
    core::errors::Result<std::filesystem::path> stage(const std::string& session_id,
                                                      const LoopState& state) const;
    core::errors::Result<std::filesystem::path> commit(
        const std::filesystem::path& staged, const std::string& session_id) const;

    core::errors::Result<std::vector<std::string>> list_sessions() const;

    const std::filesystem::path& state_dir() const { return state_dir_; }

    static std::string serialize(const LoopState& state);
    static core::errors::Result<LoopState> parse(const std::string& text);

private:
    std::filesystem::path state_dir_;
};

}  // namespace hookgate::session
