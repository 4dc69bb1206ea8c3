#pragma once

#include <iostream>
#include "core/config/gate_config.hpp"
#include "protocol/gate_request.hpp"

namespace hookgate::app {

// Each command returns the process exit status (see exit_codes.hpp).
// `out` carries operator-facing text; `err` carries the host-visible reason.

int run_hook(const core::config::GateConfig& config, std::istream& in, std::ostream& err);

int run_loop_setup(const core::config::GateConfig& config,
                   const protocol::GateRequest& request, std::istream& in,
                   std::ostream& out, std::ostream& err);

int run_loop_cancel(const core::config::GateConfig& config,
                    const protocol::GateRequest& request, std::ostream& out,
                    std::ostream& err);

int run_loop_status(const core::config::GateConfig& config,
                    const protocol::GateRequest& request, std::ostream& out,
                    std::ostream& err);

// Health check of configuration, rule sets, and state/log directories.
int run_doctor(const core::config::GateConfig& config, std::ostream& out);

// --session, else HOOKGATE_SESSION_ID, else "default".
std::string resolve_session(const protocol::GateRequest& request,
                            const core::config::EnvLookup& env = core::config::process_env);

}  // namespace hookgate::app
