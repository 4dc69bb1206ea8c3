#include "app/commands.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include "app/exit_codes.hpp"
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "policy/rule_loader.hpp"
#include "runtime/hook_dispatcher.hpp"
#include "session/audit_sink.hpp"
#include "session/iteration_controller.hpp"
#include "session/loop_state_store.hpp"

namespace hookgate::app {

using core::config::GateConfig;
using core::errors::GateError;
using protocol::Decision;
using protocol::GateRequest;

namespace {

session::IterationController make_controller(const GateConfig& config) {
    return session::IterationController(session::LoopStateStore(config.state_dir),
                                        config.default_completion_token);
}

void print_error(std::ostream& err, const GateError& error) {
    err << "Error [" << error.code << "]: " << error.message << "\n";
    if (!error.hint.empty()) {
        err << "Hint: " << error.hint << "\n";
    }
}

// Loop commands are operator actions, not host events; they still leave a
// loop-transition record.
void audit_loop_command(const GateConfig& config, const std::string& session_id,
                        const std::string& event, const std::string& summary,
                        const std::string& message) {
    const session::AuditSink audit(config.log_dir);
    auto written = audit.append(
        session::AuditConcern::LoopTransitions,
        session::make_audit_entry(session_id, event, summary, Decision::Allow, message));
    if (core::errors::is_error(written)) {
        HOOKGATE_LOG_ERROR("audit write failed: " + core::errors::get_error(written).message);
    }
}

int exit_for(const GateError& error) {
    return error.category == core::errors::ErrorCategory::Persistence
               ? kExitPersistenceFailure
               : kExitUsage;
}

void describe(std::ostream& out, const std::string& session_id,
              const std::optional<session::LoopState>& state) {
    out << "session: " << session_id << "\n";
    out << "phase: " << session::to_string(session::phase_of(state)) << "\n";
    if (!state.has_value()) {
        return;
    }
    out << "iteration: " << state->iteration << "/" << state->max_iterations << "\n";
    out << "completion_token: " << state->completion_token << "\n";
    out << "started_at: " << state->started_at << "\n";
    if (state->bound_session.has_value()) {
        out << "bound_session: " << *state->bound_session << "\n";
    }
    if (state->ended_at.has_value()) {
        out << "ended_at: " << *state->ended_at << "\n";
    }
    if (state->end_reason.has_value()) {
        out << "end_reason: " << *state->end_reason << "\n";
    }
}

// Creates the directory if needed and proves it writable with a scratch file.
bool check_writable(const std::filesystem::path& dir, std::string& problem) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        problem = "cannot create " + dir.string() + ": " + ec.message();
        return false;
    }
    const auto scratch = dir / (".doctor-check-" + core::config::generate_suffix());
    {
        std::ofstream file(scratch);
        if (!file.is_open() || !(file << "check")) {
            problem = "cannot write in " + dir.string();
            return false;
        }
    }
    std::filesystem::remove(scratch, ec);
    return true;
}

}  // namespace

std::string resolve_session(const GateRequest& request, const core::config::EnvLookup& env) {
    if (request.session_id.has_value()) {
        return *request.session_id;
    }
    const auto from_env = env("HOOKGATE_SESSION_ID");
    if (from_env.has_value() && !from_env->empty()) {
        return *from_env;
    }
    return core::config::kDefaultSessionId;
}

int run_hook(const GateConfig& config, std::istream& in, std::ostream& err) {
    const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    runtime::HookDispatcher dispatcher(policy::build_guards(config), make_controller(config),
                                       session::AuditSink(config.log_dir),
                                       config.failure_policy, config.project_dir);
    const auto result = dispatcher.dispatch(raw);

    switch (result.status) {
        case runtime::DispatchStatus::Block:
            err << result.reason << "\n";
            return kExitBlock;
        case runtime::DispatchStatus::PersistenceFailure:
            err << result.reason << "\n";
            return kExitPersistenceFailure;
        case runtime::DispatchStatus::Allow:
        default:
            return kExitOk;
    }
}

int run_loop_setup(const GateConfig& config, const GateRequest& request, std::istream& in,
                   std::ostream& out, std::ostream& err) {
    session::SetupRequest setup;
    setup.session_id = resolve_session(request);
    setup.max_iterations = request.max_iterations;
    setup.completion_token = request.completion_token;
    if (request.task_text.has_value()) {
        setup.task_text = *request.task_text;
    } else {
        setup.task_text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto controller = make_controller(config);
    auto result = controller.setup(setup);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        print_error(err, error);
        return exit_for(error);
    }

    const auto& created = core::errors::get_value(result);
    out << created.message << "\n";
    if (created.created) {
        audit_loop_command(config, setup.session_id, "loop_setup",
                           "max_iterations=" + std::to_string(created.state.max_iterations) +
                               " completion_token=" + created.state.completion_token,
                           created.message);
    }
    return kExitOk;
}

int run_loop_cancel(const GateConfig& config, const GateRequest& request, std::ostream& out,
                    std::ostream& err) {
    const std::string session_id = resolve_session(request);
    auto controller = make_controller(config);
    auto result = controller.cancel(session_id);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        print_error(err, error);
        return exit_for(error);
    }

    const auto& cancelled = core::errors::get_value(result);
    out << cancelled.message << "\n";
    if (cancelled.cancelled) {
        audit_loop_command(config, session_id, "loop_cancel", "loop-cancel", cancelled.message);
    }
    return kExitOk;
}

int run_loop_status(const GateConfig& config, const GateRequest& request, std::ostream& out,
                    std::ostream& err) {
    auto controller = make_controller(config);

    if (request.session_id.has_value()) {
        auto state = controller.status(*request.session_id);
        if (core::errors::is_error(state)) {
            print_error(err, core::errors::get_error(state));
            return kExitUsage;
        }
        describe(out, *request.session_id, core::errors::get_value(state));
        return kExitOk;
    }

    auto sessions = controller.store().list_sessions();
    if (core::errors::is_error(sessions)) {
        print_error(err, core::errors::get_error(sessions));
        return kExitUsage;
    }
    const auto& names = core::errors::get_value(sessions);
    if (names.empty()) {
        out << "No loops recorded in " << config.state_dir.string() << "\n";
        return kExitOk;
    }

    int status = kExitOk;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        auto state = controller.status(names[i]);
        if (core::errors::is_error(state)) {
            out << "session: " << names[i] << "\n";
            print_error(out, core::errors::get_error(state));
            status = kExitUsage;
            continue;
        }
        describe(out, names[i], core::errors::get_value(state));
    }
    return status;
}

int run_doctor(const GateConfig& config, std::ostream& out) {
    int problems = 0;
    auto ok = [&out](const std::string& line) { out << "[ok]   " << line << "\n"; };
    auto fail = [&out, &problems](const std::string& line) {
        out << "[fail] " << line << "\n";
        ++problems;
    };

    out << "project_dir: " << config.project_dir.string() << "\n";
    out << "config_file: "
        << (config.config_file.has_value() ? config.config_file->string() : "(none)") << "\n";
    out << "failure_policy: " << core::config::to_string(config.failure_policy) << "\n";
    if (config.allow_protected_override) {
        out << "[warn] HOOKGATE_ALLOW_PROTECTED is set; path checks are disabled\n";
    }

    auto loaded = policy::load_rules(config);
    if (core::errors::is_error(loaded)) {
        const auto& error = core::errors::get_error(loaded);
        fail("rules [" + error.code + "]: " + error.message);
    } else {
        const auto& rules = core::errors::get_value(loaded);
        auto guards = policy::build_guards(config);
        if (core::errors::is_error(guards)) {
            const auto& error = core::errors::get_error(guards);
            fail("rules [" + error.code + "]: " + error.message);
        } else {
            ok(std::to_string(rules.command_rules.size()) + " command rules, " +
               std::to_string(rules.path_policy.protected_paths.size()) +
               " protected path patterns, " +
               std::to_string(rules.path_policy.content_markers.size()) + " content markers");
        }
    }

    std::string problem;
    if (check_writable(config.state_dir, problem)) {
        ok("state_dir writable: " + config.state_dir.string());
    } else {
        fail("state_dir " + problem);
    }
    if (check_writable(config.log_dir, problem)) {
        ok("log_dir writable: " + config.log_dir.string());
    } else {
        fail("log_dir " + problem);
    }

    const session::LoopStateStore store(config.state_dir);
    auto sessions = store.list_sessions();
    if (core::errors::is_error(sessions)) {
        fail("state records: " + core::errors::get_error(sessions).message);
    } else {
        for (const auto& name : core::errors::get_value(sessions)) {
            auto state = store.load(name);
            if (core::errors::is_error(state)) {
                const auto& error = core::errors::get_error(state);
                fail("loop " + name + " [" + error.code + "]: " + error.message);
                continue;
            }
            ok("loop " + name + ": " +
               session::to_string(session::phase_of(core::errors::get_value(state))));
        }
    }

    out << (problems == 0 ? "All checks passed." : std::to_string(problems) + " problem(s) found.")
        << "\n";
    return problems == 0 ? kExitOk : kExitUsage;
}

}  // namespace hookgate::app
