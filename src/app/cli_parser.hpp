#pragma once
#include "protocol/gate_request.hpp"
#include "core/errors/gate_errors.hpp"

namespace hookgate::app::cli {
    hookgate::core::errors::Result<hookgate::protocol::GateRequest> parse_and_validate(int argc, char* argv[]);
}
