#pragma once

#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/command_request.hpp"

namespace cmdgate::app {

// {"command": "...", "args": [...], "flags": [{"name": "...", "value": "..."}]}
core::errors::Result<protocol::CommandRequest> parse_command_request(
    const std::string& json_text);

std::string admission_to_json(
    const core::errors::Result<protocol::CommandRequest>& admission);

std::string streaming_to_json(const protocol::CommandRequest& request, bool streaming);

std::string listing_to_json(const core::config::CommandSet& allowed,
                            const core::config::CommandSet& denied,
                            const core::config::CommandSet& streaming);

}  // namespace cmdgate::app
