#include "session/loop_state_store.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/config/session_id.hpp"

namespace hookgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr const char* kFence = "---";
constexpr const char* kFilePrefix = "loop-";
constexpr const char* kFileSuffix = ".md";

GateError header_error(const std::string& message) {
    return GateError{ErrorCategory::Configuration, "Malformed loop state: " + message,
                     "invalid_state_header",
                     "Inspect the state file, or cancel and set the loop up again."};
}

GateError persistence_error(const std::string& message, const std::string& code) {
    return GateError{ErrorCategory::Persistence, message, code};
}

std::optional<std::uint32_t> parse_count(const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

bool write_all(const int fd, const std::string& data) {
    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        cursor += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

void sync_directory(const std::filesystem::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    static_cast<void>(::fsync(fd));
    static_cast<void>(::close(fd));
}

}  // namespace

LoopStateStore::LoopStateStore(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)) {}

std::filesystem::path LoopStateStore::path_for(const std::string& session_id) const {
    return state_dir_ /
           (kFilePrefix + core::config::sanitize_session_id(session_id) + kFileSuffix);
}

std::string LoopStateStore::serialize(const LoopState& state) {
    std::ostringstream out;
    out << kFence << "\n"
        << "active: " << (state.active ? "true" : "false") << "\n"
        << "iteration: " << state.iteration << "\n"
        << "max_iterations: " << state.max_iterations << "\n"
        << "completion_token: " << state.completion_token << "\n"
        << "started_at: " << state.started_at << "\n"
        << "session_id: " << state.bound_session.value_or("") << "\n"
        << "ended_at: " << state.ended_at.value_or("") << "\n"
        << "end_reason: " << state.end_reason.value_or("") << "\n"
        << kFence << "\n"
        << state.task_text;
    return out.str();
}

core::errors::Result<LoopState> LoopStateStore::parse(const std::string& text) {
    const std::string opening = std::string(kFence) + "\n";
    if (text.compare(0, opening.size(), opening) != 0) {
        return header_error("missing opening '---'");
    }

    LoopState state;
    bool seen_active = false;
    bool seen_iteration = false;
    bool seen_max = false;
    bool seen_token = false;
    bool seen_started = false;

    std::size_t cursor = opening.size();
    bool closed = false;
    while (cursor < text.size()) {
        const std::size_t eol = text.find('\n', cursor);
        const std::string line =
            text.substr(cursor, eol == std::string::npos ? std::string::npos : eol - cursor);
        cursor = eol == std::string::npos ? text.size() : eol + 1;

        if (line == kFence) {
            closed = true;
            break;
        }

        const std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return header_error("header line without ':' -> " + line);
        }
        const std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }

        if (key == "active") {
            if (value != "true" && value != "false") {
                return header_error("active must be true or false");
            }
            state.active = value == "true";
            seen_active = true;
        } else if (key == "iteration" || key == "max_iterations") {
            const auto count = parse_count(value);
            if (!count || *count == 0) {
                return header_error(key + " must be a positive integer, got '" + value + "'");
            }
            if (key == "iteration") {
                state.iteration = *count;
                seen_iteration = true;
            } else {
                state.max_iterations = *count;
                seen_max = true;
            }
        } else if (key == "completion_token") {
            if (value.empty()) {
                return header_error("completion_token is empty");
            }
            state.completion_token = value;
            seen_token = true;
        } else if (key == "started_at") {
            state.started_at = value;
            seen_started = true;
        } else if (key == "session_id") {
            if (!value.empty()) {
                state.bound_session = value;
            }
        } else if (key == "ended_at") {
            if (!value.empty()) {
                state.ended_at = value;
            }
        } else if (key == "end_reason") {
            if (!value.empty()) {
                state.end_reason = value;
            }
        } else {
            return header_error("unknown header field '" + key + "'");
        }
    }

    if (!closed) {
        return header_error("missing closing '---'");
    }
    if (!seen_active || !seen_iteration || !seen_max || !seen_token || !seen_started) {
        return header_error("missing required header field");
    }

    state.task_text = text.substr(cursor);
    return state;
}

core::errors::Result<std::optional<LoopState>> LoopStateStore::load(
    const std::string& session_id) const {
    const auto file = path_for(session_id);
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        if (ec) {
            return persistence_error("Unable to stat loop state: " + file.string(),
                                     "state_read_failed");
        }
        return std::optional<LoopState>{};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return persistence_error("Unable to open loop state: " + file.string(),
                                 "state_read_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(buffer.str());
    if (core::errors::is_error(parsed)) {
        GateError error = core::errors::get_error(parsed);
        error.message += " (" + file.string() + ")";
        return error;
    }
    return std::optional<LoopState>(core::errors::get_value(parsed));
}

core::errors::Result<std::filesystem::path> LoopStateStore::stage(
    const std::string& session_id, const LoopState& state) const {
    std::error_code ec;
    std::filesystem::create_directories(state_dir_, ec);
    if (ec) {
        return persistence_error("Unable to create state directory: " + state_dir_.string(),
                                 "state_dir_create_failed");
    }

    const auto target = path_for(session_id);
    const auto staged = state_dir_ / ("." + target.filename().string() + ".tmp-" +
                                      core::config::generate_suffix());

    const int fd = ::open(staged.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return persistence_error("Unable to create temp state file " + staged.string() +
                                     ": " + std::strerror(errno),
                                 "state_write_failed");
    }

    const bool written = write_all(fd, serialize(state));
    const bool synced = written && ::fsync(fd) == 0;
    const bool closed = ::close(fd) == 0;
    if (!written || !synced || !closed) {
        const std::string reason = std::strerror(errno);
        std::filesystem::remove(staged, ec);
        return persistence_error("Unable to write temp state file " + staged.string() +
                                     ": " + reason,
                                 "state_write_failed");
    }
    return staged;
}

core::errors::Result<std::filesystem::path> LoopStateStore::commit(
    const std::filesystem::path& staged, const std::string& session_id) const {
    const auto target = path_for(session_id);
    std::error_code ec;
    std::filesystem::rename(staged, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(staged, cleanup_ec);
        return persistence_error("Unable to replace loop state " + target.string() + ": " +
                                     ec.message(),
                                 "state_rename_failed");
    }
    sync_directory(state_dir_);
    return target;
}

core::errors::Result<std::filesystem::path> LoopStateStore::save(
    const std::string& session_id, const LoopState& state) const {
    auto staged = stage(session_id, state);
    if (core::errors::is_error(staged)) {
        return core::errors::get_error(staged);
    }
    return commit(core::errors::get_value(staged), session_id);
}

core::errors::Result<std::vector<std::string>> LoopStateStore::list_sessions() const {
    std::vector<std::string> sessions;
    std::error_code ec;
    if (!std::filesystem::exists(state_dir_, ec)) {
        return sessions;
    }

    const std::string prefix = kFilePrefix;
    const std::string suffix = kFileSuffix;
    for (std::filesystem::directory_iterator it(state_dir_, ec), end; !ec && it != end;
         it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() ||
            name.compare(0, prefix.size(), prefix) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        sessions.push_back(
            name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
    }
    if (ec) {
        return persistence_error("Unable to list state directory: " + state_dir_.string(),
                                 "state_read_failed");
    }
    return sessions;
}

}  // namespace hookgate::session
