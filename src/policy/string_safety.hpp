#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::policy {

struct StringCheck {
    std::size_t max_length = 0;
    std::string field_label;
    bool require_non_empty = false;
    bool enforce_shell_safety = false;
};

// Length, null-byte and shell-metacharacter checks for any string field.
// Reports the first violated rule only: length, then null byte, then shell chars.
class StringSafetyChecker {
public:
    explicit StringSafetyChecker(
        core::config::PlatformDialect dialect = core::config::host_dialect());

    core::errors::Result<std::string> check(const std::string& value,
                                            const StringCheck& rules) const;

    core::errors::Result<std::string> check(const std::string& value,
                                            std::size_t max_length,
                                            const std::string& field_label,
                                            bool enforce_shell_safety) const;

    const std::vector<std::string>& shell_sequences() const;

    static std::vector<std::string> shell_sequences_for(
        core::config::PlatformDialect dialect);

private:
    std::vector<std::string> shell_sequences_;
};

}  // namespace cmdgate::policy
