#include "session/audit_sink.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/time_format.hpp"

namespace hookgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

std::string trim_summary(const std::string& text) {
    constexpr std::size_t kMaxSummaryLength = 2000;
    if (text.size() <= kMaxSummaryLength) {
        return text;
    }
    return text.substr(0, kMaxSummaryLength) + "...";
}

}  // namespace

AuditEntry make_audit_entry(std::string session_id, std::string event_kind,
                            std::string operation_summary,
                            const protocol::Decision decision, std::string reason) {
    AuditEntry entry;
    entry.timestamp = core::now_iso8601();
    entry.ts_unix_ms = core::now_unix_ms();
    entry.session_id = std::move(session_id);
    entry.event_kind = std::move(event_kind);
    entry.operation_summary = std::move(operation_summary);
    entry.decision = decision;
    entry.reason = std::move(reason);
    return entry;
}

AuditSink::AuditSink(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {}

std::string AuditSink::file_name(const AuditConcern concern) {
    switch (concern) {
        case AuditConcern::Commands:
            return "commands.jsonl";
        case AuditConcern::FileEdits:
            return "file_edits.jsonl";
        case AuditConcern::Prompts:
            return "prompts.jsonl";
        case AuditConcern::LoopTransitions:
            return "loop.jsonl";
        case AuditConcern::Lifecycle:
        default:
            return "events.jsonl";
    }
}

core::errors::Result<std::filesystem::path> AuditSink::sink_path(
    const AuditConcern concern) const {
    if (log_dir_.empty()) {
        return GateError{ErrorCategory::Configuration, "Audit log directory is not set.",
                         "invalid_log_dir"};
    }

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        return GateError{ErrorCategory::Persistence,
                         "Unable to create audit log directory: " + log_dir_.string(),
                         "audit_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(log_dir_, ec) || ec) {
        return GateError{ErrorCategory::Persistence,
                         "Audit log path is not a directory: " + log_dir_.string(),
                         "audit_dir_create_failed"};
    }
    return log_dir_ / file_name(concern);
}

core::errors::Result<std::filesystem::path> AuditSink::append(
    const AuditConcern concern, const AuditEntry& entry) const {
    auto path_result = sink_path(concern);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json record;
    record["ts"] = entry.timestamp;
    record["ts_unix_ms"] = entry.ts_unix_ms;
    record["session_id"] = entry.session_id;
    record["event"] = entry.event_kind;
    record["operation"] = trim_summary(entry.operation_summary);
    record["decision"] = protocol::to_string(entry.decision);
    record["reason"] = entry.reason;

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Persistence,
                         "Unable to open audit log: " + path.string(),
                         "audit_open_failed"};
    }

    // Invalid UTF-8 from the agent must not make dump() throw.
    out << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out.good()) {
        return GateError{ErrorCategory::Persistence,
                         "Unable to write audit record: " + path.string(),
                         "audit_write_failed"};
    }
    return path;
}

}  // namespace hookgate::session
