#pragma once
#include <string>
#include <vector>

namespace cmdgate::protocol {

    // A command-line flag without leading dashes; empty value means a boolean flag.
    struct Flag {
        std::string name;
        std::string value;
    };

    // Structured command an agent asks to forward to the external tool
    struct CommandRequest {
        std::string command;            // e.g., "service"
        std::vector<std::string> args;  // e.g., ["list"]
        std::vector<Flag> flags;        // applied in order
    };

} // namespace cmdgate::protocol
