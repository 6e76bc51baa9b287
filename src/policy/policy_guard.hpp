#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "policy/command_policy.hpp"
#include "policy/path_safety.hpp"
#include "policy/streaming_classifier.hpp"
#include "policy/string_safety.hpp"
#include "protocol/command_request.hpp"

namespace cmdgate::policy {

// Entry point for every field of a command before it is forwarded to the
// external tool. All validate_* calls are pure functions of their input and
// the configuration fixed at construction; only streaming() is mutable.
class PolicyGuard {
public:
    explicit PolicyGuard(core::config::GateConfig config = {});

    core::errors::Result<std::string> validate_command(const std::string& command) const;

    core::errors::Result<std::vector<std::string>> validate_args(
        const std::vector<std::string>& args) const;

    core::errors::Result<std::string> validate_flag_name(const std::string& name) const;

    core::errors::Result<std::string> validate_flag_value(const std::string& value) const;

    core::errors::Result<std::string> validate_path(const std::string& path) const;

    // command, then args, then each flag name/value in order; first failure wins.
    core::errors::Result<protocol::CommandRequest> validate_all(
        const std::string& command, const std::vector<std::string>& args,
        const std::vector<protocol::Flag>& flags) const;

    // Full pre-dispatch gate: splits "service list" style commands, runs
    // validate_all, checks path-valued flags, then applies the deny-set.
    core::errors::Result<protocol::CommandRequest> admit(
        protocol::CommandRequest request) const;

    bool is_allowed(const std::string& command) const;
    bool is_denied(const std::string& command, const std::vector<std::string>& args) const;
    std::optional<std::string> denied_path(const std::string& command,
                                           const std::vector<std::string>& args) const;

    const CommandPolicy& command_policy() const { return command_policy_; }
    StreamingClassifier& streaming() { return streaming_; }
    const StreamingClassifier& streaming() const { return streaming_; }
    core::config::PlatformDialect dialect() const { return dialect_; }

    // {"command": "service list"} becomes {"command": "service", "args": ["list", ...]}.
    static protocol::CommandRequest normalize_request(protocol::CommandRequest request);

    static bool is_path_flag(const std::string& flag_name);
    static std::string build_command_line(const protocol::CommandRequest& request);

private:
    static bool is_valid_flag_name_format(const std::string& name);

    core::config::PlatformDialect dialect_;
    CommandPolicy command_policy_;
    StringSafetyChecker string_checker_;
    PathSafetyChecker path_checker_;
    StreamingClassifier streaming_;
};

}  // namespace cmdgate::policy
