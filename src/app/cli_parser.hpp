#pragma once
#include "protocol/gate_invocation.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::app::cli {
    cmdgate::core::errors::Result<cmdgate::protocol::GateInvocation> parse_and_validate(int argc, char* argv[]);
}
