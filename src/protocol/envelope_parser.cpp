#include "protocol/envelope_parser.hpp"

#include <fstream>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace hookgate::protocol {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

GateError envelope_error(const std::string& message, const std::string& code) {
    return GateError{ErrorCategory::Envelope, message, code};
}

// Present-and-string, or nullopt. A present field of the wrong type is reported
// through `type_error` so required fields can tell "missing" from "malformed".
std::optional<std::string> string_field(const json& object, const char* key,
                                        bool* type_error = nullptr) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        if (type_error != nullptr) {
            *type_error = true;
        }
        return std::nullopt;
    }
    return it->get<std::string>();
}

core::errors::Result<std::string> required_string(const json& object,
                                                  const char* key,
                                                  const std::string& context) {
    bool type_error = false;
    auto value = string_field(object, key, &type_error);
    if (type_error) {
        return envelope_error(context + "." + key + " must be a string",
                              "invalid_envelope");
    }
    if (!value.has_value()) {
        return envelope_error(context + " is missing " + key, "missing_payload");
    }
    return std::move(value.value());
}

core::errors::Result<OperationPayload> extract_payload(
    const Operation operation, const std::string& tool_name, const json& input) {
    switch (operation) {
        case Operation::RunShellCommand: {
            auto command = required_string(input, "command", tool_name);
            if (core::errors::is_error(command)) {
                return core::errors::get_error(command);
            }
            return OperationPayload{CommandPayload{core::errors::get_value(command)}};
        }
        case Operation::WriteFile:
        case Operation::EditFile: {
            const bool notebook = tool_name == "NotebookEdit";
            auto path = required_string(input, notebook ? "notebook_path" : "file_path",
                                        tool_name);
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            if (core::errors::get_value(path).empty()) {
                return envelope_error(tool_name + " target path is empty",
                                      "missing_payload");
            }

            FileWritePayload payload;
            payload.path = core::errors::get_value(path);
            if (tool_name == "Write") {
                payload.content = string_field(input, "content").value_or("");
            } else if (notebook) {
                payload.content = string_field(input, "new_source").value_or("");
            } else if (tool_name == "MultiEdit") {
                const auto edits = input.find("edits");
                if (edits != input.end() && edits->is_array()) {
                    for (const auto& edit : *edits) {
                        if (!edit.is_object()) {
                            continue;
                        }
                        if (!payload.content.empty()) {
                            payload.content += "\n";
                        }
                        payload.content += string_field(edit, "new_string").value_or("");
                    }
                }
            } else {
                payload.content = string_field(input, "new_string").value_or("");
            }
            return OperationPayload{std::move(payload)};
        }
        case Operation::None:
        case Operation::Other:
        default:
            return OperationPayload{};
    }
}

std::string text_of_content(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string text;
    if (!content.is_array()) {
        return text;
    }
    for (const auto& block : content) {
        if (!block.is_object()) {
            continue;
        }
        if (string_field(block, "type").value_or("") != "text") {
            continue;
        }
        const auto piece = string_field(block, "text");
        if (!piece) {
            continue;
        }
        if (!text.empty()) {
            text += "\n";
        }
        text += *piece;
    }
    return text;
}

}  // namespace

Operation operation_for_tool(const std::string& tool_name) {
    if (tool_name == "Bash") {
        return Operation::RunShellCommand;
    }
    if (tool_name == "Write") {
        return Operation::WriteFile;
    }
    if (tool_name == "Edit" || tool_name == "MultiEdit" || tool_name == "NotebookEdit") {
        return Operation::EditFile;
    }
    return Operation::Other;
}

core::errors::Result<HookEvent> parse_envelope(const std::string& raw) {
    const json envelope = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (envelope.is_discarded()) {
        return envelope_error("Hook input is not valid JSON.", "invalid_envelope");
    }
    if (!envelope.is_object()) {
        return envelope_error("Hook input must be a JSON object.", "invalid_envelope");
    }

    auto event_name = required_string(envelope, "hook_event_name", "envelope");
    if (core::errors::is_error(event_name)) {
        return core::errors::get_error(event_name);
    }
    const auto kind = parse_event_kind(core::errors::get_value(event_name));
    if (!kind.has_value()) {
        return envelope_error("Unknown hook event: " + core::errors::get_value(event_name),
                              "unknown_event");
    }

    HookEvent event;
    event.kind = kind.value();
    event.session_id = string_field(envelope, "session_id").value_or("");
    if (auto cwd = string_field(envelope, "cwd"); cwd && !cwd->empty()) {
        event.cwd = std::filesystem::path(*cwd);
    }

    switch (event.kind) {
        case HookEventKind::PreInvocation:
        case HookEventKind::PostInvocation:
        case HookEventKind::PostInvocationFailure: {
            auto tool_name = required_string(envelope, "tool_name", "envelope");
            if (core::errors::is_error(tool_name)) {
                return core::errors::get_error(tool_name);
            }
            event.tool_name = core::errors::get_value(tool_name);
            if (event.tool_name.empty()) {
                return envelope_error("envelope has an empty tool_name", "missing_payload");
            }
            event.operation = operation_for_tool(event.tool_name);

            const auto input = envelope.find("tool_input");
            const bool has_input = input != envelope.end() && input->is_object();
            if (event.kind == HookEventKind::PreInvocation) {
                if (!has_input) {
                    return envelope_error("PreToolUse envelope is missing tool_input",
                                          "missing_payload");
                }
                auto payload = extract_payload(event.operation, event.tool_name, *input);
                if (core::errors::is_error(payload)) {
                    return core::errors::get_error(payload);
                }
                event.payload = core::errors::get_value(payload);
            } else if (has_input) {
                // Post events are audit-only; a thin payload is not a parse failure.
                auto payload = extract_payload(event.operation, event.tool_name, *input);
                if (!core::errors::is_error(payload)) {
                    event.payload = core::errors::get_value(payload);
                }
            }
            break;
        }
        case HookEventKind::PromptSubmitted:
            event.text = string_field(envelope, "prompt").value_or("");
            break;
        case HookEventKind::SessionStop:
        case HookEventKind::SubagentStop:
            event.last_output = string_field(envelope, "last_assistant_message");
            if (auto transcript = string_field(envelope, "transcript_path");
                transcript && !transcript->empty()) {
                event.transcript_path = std::filesystem::path(*transcript);
            }
            break;
        case HookEventKind::Notification:
            event.text = string_field(envelope, "message").value_or("");
            break;
    }

    return event;
}

core::errors::Result<std::string> read_last_assistant_text(
    const std::filesystem::path& transcript_path) {
    std::ifstream in(transcript_path);
    if (!in.is_open()) {
        return envelope_error("Unable to open transcript: " + transcript_path.string(),
                              "transcript_unreadable");
    }

    std::optional<std::string> last;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const json entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) {
            continue;
        }

        const json* message = &entry;
        const auto nested = entry.find("message");
        if (nested != entry.end() && nested->is_object()) {
            message = &(*nested);
        }

        const bool assistant =
            string_field(entry, "type").value_or("") == "assistant" ||
            string_field(*message, "role").value_or("") == "assistant";
        if (!assistant) {
            continue;
        }
        const auto content = message->find("content");
        if (content == message->end()) {
            continue;
        }
        last = text_of_content(*content);
    }

    if (!last.has_value()) {
        return envelope_error("Transcript has no assistant output: " +
                                  transcript_path.string(),
                              "transcript_empty");
    }
    return std::move(last.value());
}

}  // namespace hookgate::protocol
