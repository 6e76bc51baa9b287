#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/decision_report.hpp"
#include "config/gate_config_loader.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = cmdgate::app::cli::parse_and_validate(argc, argv);
    if (cmdgate::core::errors::is_error(parsed)) {
        const auto& err = cmdgate::core::errors::get_error(parsed);
        CMDGATE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CMDGATE_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& invocation = cmdgate::core::errors::get_value(parsed);
    if (invocation.verbose) {
        cmdgate::core::logging::Logger::get().set_min_level(cmdgate::core::logging::LogLevel::DEBUG);
    }

    // 2. Load allow/deny lists once, before any request is judged
    auto loaded = cmdgate::config::load_gate_config(invocation.list_sources);
    if (cmdgate::core::errors::is_error(loaded)) {
        const auto& err = cmdgate::core::errors::get_error(loaded);
        CMDGATE_LOG_ERROR("Failed to load command lists [" + err.code + "]: " + err.message);
        return 3;
    }
    const auto& config = cmdgate::core::errors::get_value(loaded);
    CMDGATE_LOG_DEBUG("Path dialect: " + cmdgate::core::config::to_string(config.dialect));

    const cmdgate::policy::PolicyGuard guard(config);

    if (invocation.mode == cmdgate::protocol::GateMode::ListCommands) {
        std::cout << cmdgate::app::listing_to_json(guard.command_policy().allow_set(),
                                                   guard.command_policy().deny_set(),
                                                   guard.streaming().list())
                  << std::endl;
        return 0;
    }

    // 3. Decode the request
    auto request = cmdgate::app::parse_command_request(invocation.request_json.value_or(""));
    if (cmdgate::core::errors::is_error(request)) {
        const auto& err = cmdgate::core::errors::get_error(request);
        CMDGATE_LOG_ERROR("Request error [" + err.code + "]: " + err.message);
        std::cout << cmdgate::app::admission_to_json(request) << std::endl;
        return 2;
    }
    const auto& command_request = cmdgate::core::errors::get_value(request);

    if (invocation.mode == cmdgate::protocol::GateMode::Streaming) {
        const auto lookup = cmdgate::policy::PolicyGuard::normalize_request(command_request);
        const bool streaming =
            guard.streaming().is_streaming(lookup.command, lookup.args);
        CMDGATE_LOG_DEBUG("Streaming lookup for '" + lookup.command + "': " +
                          (streaming ? "yes" : "no"));
        std::cout << cmdgate::app::streaming_to_json(lookup, streaming) << std::endl;
        return streaming ? 0 : 1;
    }

    // 4. Judge
    auto admission = guard.admit(command_request);
    std::cout << cmdgate::app::admission_to_json(admission) << std::endl;
    if (cmdgate::core::errors::is_error(admission)) {
        const auto& err = cmdgate::core::errors::get_error(admission);
        CMDGATE_LOG_WARN("Rejected [" + err.code + "]: " + err.message);
        return 1;
    }

    CMDGATE_LOG_INFO("Admitted: " + cmdgate::policy::PolicyGuard::build_command_line(
                                        cmdgate::core::errors::get_value(admission)));
    return 0;
}
