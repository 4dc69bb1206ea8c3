#pragma once

#include <filesystem>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/hook_event.hpp"

namespace hookgate::protocol {

// Parses one host envelope (a JSON object) into a HookEvent.
// Malformed input yields an Envelope error, never a partial event.
core::errors::Result<HookEvent> parse_envelope(const std::string& raw);

// Maps a host tool name ("Bash", "Write", ...) to the operation it performs.
Operation operation_for_tool(const std::string& tool_name);

// Text of the last assistant entry in a JSONL transcript.
core::errors::Result<std::string> read_last_assistant_text(
    const std::filesystem::path& transcript_path);

}  // namespace hookgate::protocol
