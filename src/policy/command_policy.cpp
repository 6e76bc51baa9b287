#include "policy/command_policy.hpp"

#include <utility>
#include "policy/command_path_matcher.hpp"

namespace cmdgate::policy {

using core::config::CommandSet;

CommandPolicy::CommandPolicy()
    : CommandPolicy(default_allow_set(), default_deny_set()) {}

CommandPolicy::CommandPolicy(CommandSet allow_set, CommandSet deny_set)
    : allow_set_(std::move(allow_set)), deny_set_(std::move(deny_set)) {}

CommandPolicy CommandPolicy::from_config(const core::config::GateConfig& config) {
    CommandSet allow;
    if (config.custom_allow_set.has_value()) {
        allow = config.custom_allow_set.value();
    } else if (config.use_default_allow_set) {
        allow = default_allow_set();
    }

    CommandSet deny = config.custom_deny_set.has_value()
                          ? config.custom_deny_set.value()
                          : default_deny_set();
    return CommandPolicy(std::move(allow), std::move(deny));
}

CommandSet CommandPolicy::default_allow_set() {
    return {
        // Service management
        "service", "service-auth", "service-version", "backend", "domain",
        "domain-v1", "healthcheck", "logging", "acl", "acl-entry", "vcl",
        "dictionary", "dictionary-entry", "purge",
        // Edge compute
        "compute", "object-storage",
        // Configuration and stores
        "config", "config-store", "config-store-entry", "secret-store",
        "secret-store-entry", "kv-store", "kv-store-entry",
        // Users
        "user", "whoami",
        // Monitoring
        "alerts", "dashboard", "log-tail", "stats",
        // Security and networking
        "rate-limit", "ip-list", "tls-config", "tls-custom", "tls-platform",
        "tls-subscription",
        // Resources
        "products", "resource-link",
        // Utilities
        "version", "help", "pops", "tools", "install", "update"};
}

CommandSet CommandPolicy::default_deny_set() {
    return {
        "stats realtime",
        "log-tail",
        "vcl custom create",
        "vcl custom update",
        "vcl custom describe",
        "vcl snippet create",
        "vcl snippet update",
        "vcl snippet describe"};
}

bool CommandPolicy::is_allowed(const std::string& command) const {
    return allow_set_.count(command) != 0;
}

bool CommandPolicy::is_denied(const std::string& command,
                              const std::vector<std::string>& args) const {
    return CommandPathMatcher::matches(deny_set_, command, args);
}

std::optional<std::string> CommandPolicy::denied_path(
    const std::string& command, const std::vector<std::string>& args) const {
    return CommandPathMatcher::matched_path(deny_set_, command, args);
}

}  // namespace cmdgate::policy
