#include "policy/command_path_matcher.hpp"

#include <algorithm>

namespace cmdgate::policy {

bool CommandPathMatcher::matches(const core::config::CommandSet& set,
                                 const std::string& command,
                                 const std::vector<std::string>& args) {
    return matched_path(set, command, args).has_value();
}

std::optional<std::string> CommandPathMatcher::matched_path(
    const core::config::CommandSet& set, const std::string& command,
    const std::vector<std::string>& args) {
    std::string candidate = command;
    if (set.count(candidate) != 0) {
        return candidate;
    }

    const std::size_t depth = std::min(args.size(), kMaxArgDepth);
    for (std::size_t i = 0; i < depth; ++i) {
        candidate += ' ';
        candidate += args[i];
        if (set.count(candidate) != 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace cmdgate::policy
