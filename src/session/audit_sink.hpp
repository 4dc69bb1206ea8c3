#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/verdict.hpp"

namespace hookgate::session {

// One JSONL file per concern under the log directory.
enum class AuditConcern {
    Commands,
    FileEdits,
    Prompts,
    LoopTransitions,
    Lifecycle
};

struct AuditEntry {
    std::string timestamp;
    std::int64_t ts_unix_ms = 0;
    std::string session_id;
    std::string event_kind;
    std::string operation_summary;
    protocol::Decision decision = protocol::Decision::Allow;
    std::string reason;
};

// Stamps timestamp and ts_unix_ms with the current time.
AuditEntry make_audit_entry(std::string session_id, std::string event_kind,
                            std::string operation_summary, protocol::Decision decision,
                            std::string reason);

// Append-only. Never rewrites or truncates earlier records.
class AuditSink {
public:
    explicit AuditSink(std::filesystem::path log_dir);

    core::errors::Result<std::filesystem::path> append(AuditConcern concern,
                                                       const AuditEntry& entry) const;

    core::errors::Result<std::filesystem::path> sink_path(AuditConcern concern) const;

    static std::string file_name(AuditConcern concern);

private:
    std::filesystem::path log_dir_;
};

}  // namespace hookgate::session
