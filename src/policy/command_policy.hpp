#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"

namespace cmdgate::policy {

// Allow-set of top-level command names plus a path-granular deny-set.
// The two are independent predicates: a caller admits a command only when
// is_allowed(cmd) && !is_denied(cmd, args). Both sets are fixed at construction.
class CommandPolicy {
public:
    CommandPolicy();
    CommandPolicy(core::config::CommandSet allow_set, core::config::CommandSet deny_set);

    static CommandPolicy from_config(const core::config::GateConfig& config);

    bool is_allowed(const std::string& command) const;
    bool is_denied(const std::string& command, const std::vector<std::string>& args) const;
    std::optional<std::string> denied_path(const std::string& command,
                                           const std::vector<std::string>& args) const;

    const core::config::CommandSet& allow_set() const { return allow_set_; }
    const core::config::CommandSet& deny_set() const { return deny_set_; }

    static core::config::CommandSet default_allow_set();
    static core::config::CommandSet default_deny_set();

private:
    core::config::CommandSet allow_set_;
    core::config::CommandSet deny_set_;
};

}  // namespace cmdgate::policy
