#pragma once
#include <optional>
#include <string>
#include "config/gate_config_loader.hpp"

namespace cmdgate::protocol {

    enum class GateMode {
        Check,         // full admission decision for one request
        Streaming,     // background-eligibility lookup for one request
        ListCommands   // dump effective allow/deny/streaming sets
    };

    // Validated command-line input for one cmdgate invocation
    struct GateInvocation {
        GateMode mode = GateMode::Check;
        std::optional<std::string> request_json;
        config::ListSources list_sources;
        bool verbose = false;
    };

} // namespace cmdgate::protocol
