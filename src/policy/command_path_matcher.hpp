#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"

namespace cmdgate::policy {

// Tests "cmd", "cmd a0", "cmd a0 a1", "cmd a0 a1 a2" against a set of
// space-joined paths. Arguments past the third are never consulted.
class CommandPathMatcher {
public:
    static constexpr std::size_t kMaxArgDepth = 3;

    static bool matches(const core::config::CommandSet& set,
                        const std::string& command,
                        const std::vector<std::string>& args);

    // First (shortest) matching path.
    static std::optional<std::string> matched_path(
        const core::config::CommandSet& set, const std::string& command,
        const std::vector<std::string>& args);
};

}  // namespace cmdgate::policy
