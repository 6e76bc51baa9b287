#include "app/decision_report.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "policy/policy_guard.hpp"

namespace cmdgate::app {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::CommandRequest;
using protocol::Flag;

namespace {

GateError request_error(const std::string& message) {
    return GateError{ErrorCategory::Config, message, "invalid_request",
                     "Expected {\"command\": str, \"args\": [str], "
                     "\"flags\": [{\"name\": str, \"value\": str}]}"};
}

json set_to_json(const core::config::CommandSet& set) {
    json list = json::array();
    for (const auto& entry : set) {
        list.push_back(entry);
    }
    return list;
}

}  // namespace

core::errors::Result<CommandRequest> parse_command_request(const std::string& json_text) {
    const json payload = json::parse(json_text, nullptr, false);
    if (payload.is_discarded()) {
        return request_error("Request is not valid JSON.");
    }
    if (!payload.is_object()) {
        return request_error("Request must be a JSON object.");
    }

    CommandRequest request;
    const auto command = payload.find("command");
    if (command == payload.end() || !command->is_string()) {
        return request_error("Request is missing a string \"command\".");
    }
    request.command = command->get<std::string>();

    const auto args = payload.find("args");
    if (args != payload.end() && !args->is_null()) {
        if (!args->is_array()) {
            return request_error("\"args\" must be an array of strings.");
        }
        for (const auto& arg : *args) {
            if (!arg.is_string()) {
                return request_error("\"args\" must be an array of strings.");
            }
            request.args.push_back(arg.get<std::string>());
        }
    }

    const auto flags = payload.find("flags");
    if (flags != payload.end() && !flags->is_null()) {
        if (!flags->is_array()) {
            return request_error("\"flags\" must be an array of objects.");
        }
        for (const auto& entry : *flags) {
            if (!entry.is_object()) {
                return request_error("\"flags\" must be an array of objects.");
            }
            const auto name = entry.find("name");
            if (name == entry.end() || !name->is_string()) {
                return request_error("Each flag needs a string \"name\".");
            }
            Flag flag;
            flag.name = name->get<std::string>();
            const auto value = entry.find("value");
            if (value != entry.end() && !value->is_null()) {
                if (!value->is_string()) {
                    return request_error("Flag \"value\" must be a string.");
                }
                flag.value = value->get<std::string>();
            }
            request.flags.push_back(std::move(flag));
        }
    }

    return request;
}

std::string admission_to_json(const core::errors::Result<CommandRequest>& admission) {
    json payload;
    if (core::errors::is_error(admission)) {
        const auto& err = core::errors::get_error(admission);
        payload["admitted"] = false;
        payload["error"] = err.message;
        payload["error_code"] = err.code;
        payload["category"] = core::errors::to_string(err.category);
        if (!err.hint.empty()) {
            payload["hint"] = err.hint;
        }
        return payload.dump();
    }

    const auto& request = core::errors::get_value(admission);
    payload["admitted"] = true;
    payload["command"] = request.command;
    payload["command_line"] = policy::PolicyGuard::build_command_line(request);
    return payload.dump();
}

std::string streaming_to_json(const CommandRequest& request, const bool streaming) {
    json payload;
    payload["command"] = request.command;
    payload["args"] = request.args;
    payload["streaming"] = streaming;
    return payload.dump();
}

std::string listing_to_json(const core::config::CommandSet& allowed,
                            const core::config::CommandSet& denied,
                            const core::config::CommandSet& streaming) {
    json payload;
    payload["allowed"] = set_to_json(allowed);
    payload["denied"] = set_to_json(denied);
    payload["streaming"] = set_to_json(streaming);
    return payload.dump();
}

}  // namespace cmdgate::app
