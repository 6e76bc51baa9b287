#include "policy/policy_guard.hpp"

#include <sstream>
#include <unordered_set>
#include <utility>

namespace cmdgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::CommandRequest;
using protocol::Flag;

namespace {

GateError with_context(GateError error, const std::string& context) {
    error.message = context + error.message;
    return error;
}

bool is_ascii_letter(const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(const char c) {
    return c >= '0' && c <= '9';
}

std::vector<std::string> split_fields(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    return fields;
}

}  // namespace

PolicyGuard::PolicyGuard(core::config::GateConfig config)
    : dialect_(config.dialect),
      command_policy_(CommandPolicy::from_config(config)),
      string_checker_(config.dialect),
      path_checker_(config.dialect) {}

bool PolicyGuard::is_valid_flag_name_format(const std::string& name) {
    if (name.empty() || !is_ascii_letter(name.front())) {
        return false;
    }
    for (const char c : name) {
        if (!is_ascii_letter(c) && !is_ascii_digit(c) && c != '-') {
            return false;
        }
    }
    return true;
}

bool PolicyGuard::is_path_flag(const std::string& flag_name) {
    static const std::unordered_set<std::string> path_flags = {
        "file", "path", "config", "config-file", "output", "input", "cert", "key",
        "ca-cert", "manifest", "package", "dir", "directory", "from", "to"};
    return path_flags.count(flag_name) != 0;
}

std::string PolicyGuard::build_command_line(const CommandRequest& request) {
    std::string line = request.command;
    for (const auto& arg : request.args) {
        line += " " + arg;
    }
    for (const auto& flag : request.flags) {
        line += " --" + flag.name;
        if (!flag.value.empty()) {
            line += " " + flag.value;
        }
    }
    return line;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    // Command names come from a fixed vocabulary, so no shell-char scan here.
    StringCheck rules;
    rules.max_length = core::config::kMaxCommandLength;
    rules.field_label = "command";
    rules.require_non_empty = true;
    auto shape = string_checker_.check(command, rules);
    if (core::errors::is_error(shape)) {
        return core::errors::get_error(shape);
    }

    if (!command_policy_.is_allowed(command)) {
        return GateError{ErrorCategory::Policy,
                         "command '" + command +
                             "' is not available: not in the allowed list",
                         "command_not_allowed",
                         "Use one of the commands reported by list-commands."};
    }
    return command;
}

core::errors::Result<std::vector<std::string>> PolicyGuard::validate_args(
    const std::vector<std::string>& args) const {
    for (std::size_t i = 0; i < args.size(); ++i) {
        auto checked = string_checker_.check(args[i], core::config::kMaxArgLength,
                                             "argument " + std::to_string(i), true);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
    }
    return args;
}

core::errors::Result<std::string> PolicyGuard::validate_flag_name(
    const std::string& name) const {
    StringCheck rules;
    rules.max_length = core::config::kMaxFlagNameLength;
    rules.field_label = "flag name";
    rules.require_non_empty = true;
    auto shape = string_checker_.check(name, rules);
    if (core::errors::is_error(shape)) {
        return core::errors::get_error(shape);
    }

    if (!is_valid_flag_name_format(name)) {
        return GateError{ErrorCategory::Format,
                         "flag name contains invalid characters (must start with "
                         "letter, contain only alphanumeric and hyphens)",
                         "invalid_flag_name"};
    }
    return name;
}

core::errors::Result<std::string> PolicyGuard::validate_flag_value(
    const std::string& value) const {
    // Empty is fine: it stands for a valueless boolean flag.
    return string_checker_.check(value, core::config::kMaxFlagValueLength,
                                 "flag value", true);
}

core::errors::Result<std::string> PolicyGuard::validate_path(
    const std::string& path) const {
    return path_checker_.check_path(path);
}

core::errors::Result<CommandRequest> PolicyGuard::validate_all(
    const std::string& command, const std::vector<std::string>& args,
    const std::vector<Flag>& flags) const {
    auto command_result = validate_command(command);
    if (core::errors::is_error(command_result)) {
        return with_context(core::errors::get_error(command_result), "invalid command: ");
    }

    auto args_result = validate_args(args);
    if (core::errors::is_error(args_result)) {
        return with_context(core::errors::get_error(args_result), "invalid arguments: ");
    }

    for (const auto& flag : flags) {
        auto name_result = validate_flag_name(flag.name);
        if (core::errors::is_error(name_result)) {
            return with_context(core::errors::get_error(name_result),
                                "invalid flag '" + flag.name + "': ");
        }
        auto value_result = validate_flag_value(flag.value);
        if (core::errors::is_error(value_result)) {
            return with_context(core::errors::get_error(value_result),
                                "invalid value for flag '" + flag.name + "': ");
        }
    }

    return CommandRequest{command, args, flags};
}

CommandRequest PolicyGuard::normalize_request(CommandRequest request) {
    auto parts = split_fields(request.command);
    if (parts.size() > 1) {
        request.command = parts.front();
        std::vector<std::string> args(parts.begin() + 1, parts.end());
        args.insert(args.end(), request.args.begin(), request.args.end());
        request.args = std::move(args);
    }
    return request;
}

core::errors::Result<CommandRequest> PolicyGuard::admit(CommandRequest request) const {
    request = normalize_request(std::move(request));

    auto validated = validate_all(request.command, request.args, request.flags);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    for (const auto& flag : request.flags) {
        if (!is_path_flag(flag.name) || flag.value.empty()) {
            continue;
        }
        auto path_result = validate_path(flag.value);
        if (core::errors::is_error(path_result)) {
            return with_context(core::errors::get_error(path_result),
                                "invalid path for flag '" + flag.name + "': ");
        }
    }

    const auto denied = command_policy_.denied_path(request.command, request.args);
    if (denied.has_value()) {
        return GateError{ErrorCategory::Policy,
                         "The '" + denied.value() + "' command is not available",
                         "command_denied",
                         "This command path is blocked by the deny list."};
    }

    return request;
}

bool PolicyGuard::is_allowed(const std::string& command) const {
    return command_policy_.is_allowed(command);
}

bool PolicyGuard::is_denied(const std::string& command,
                            const std::vector<std::string>& args) const {
    return command_policy_.is_denied(command, args);
}

std::optional<std::string> PolicyGuard::denied_path(
    const std::string& command, const std::vector<std::string>& args) const {
    return command_policy_.denied_path(command, args);
}

}  // namespace cmdgate::policy
