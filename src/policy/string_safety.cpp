#include "policy/string_safety.hpp"

#include <string>

namespace cmdgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

// Matched by substring containment in this order; no escaping is honored.
const std::vector<std::string>& base_shell_sequences() {
    static const std::vector<std::string> sequences = {
        ";", "|", "&", "&&", "||", "`", "$", "(", ")", "<", ">", ">>", "<<",
        "*", "?", "[", "]", "{", "}", "\\", "\n", "\r", "\t",
        "$(", "${", ";&", ";;&", "|&", ">&", "<&"};
    return sequences;
}

// cmd.exe escape, variable expansion, delayed expansion, substring.
const std::vector<std::string>& windows_shell_sequences() {
    static const std::vector<std::string> sequences = {"^", "%", "!", "~"};
    return sequences;
}

std::string printable(const std::string& sequence) {
    if (sequence == "\n") return "\\n";
    if (sequence == "\r") return "\\r";
    if (sequence == "\t") return "\\t";
    return sequence;
}

}  // namespace

StringSafetyChecker::StringSafetyChecker(const core::config::PlatformDialect dialect)
    : shell_sequences_(shell_sequences_for(dialect)) {}

std::vector<std::string> StringSafetyChecker::shell_sequences_for(
    const core::config::PlatformDialect dialect) {
    std::vector<std::string> sequences = base_shell_sequences();
    if (dialect == core::config::PlatformDialect::Windows) {
        const auto& extra = windows_shell_sequences();
        sequences.insert(sequences.end(), extra.begin(), extra.end());
    }
    return sequences;
}

const std::vector<std::string>& StringSafetyChecker::shell_sequences() const {
    return shell_sequences_;
}

core::errors::Result<std::string> StringSafetyChecker::check(
    const std::string& value, const std::size_t max_length,
    const std::string& field_label, const bool enforce_shell_safety) const {
    StringCheck rules;
    rules.max_length = max_length;
    rules.field_label = field_label;
    rules.enforce_shell_safety = enforce_shell_safety;
    return check(value, rules);
}

core::errors::Result<std::string> StringSafetyChecker::check(
    const std::string& value, const StringCheck& rules) const {
    if (rules.require_non_empty && value.empty()) {
        return GateError{ErrorCategory::InputShape,
                         rules.field_label + " cannot be empty",
                         "empty_value"};
    }
    if (value.size() > rules.max_length) {
        return GateError{ErrorCategory::InputShape,
                         rules.field_label + " exceeds maximum length of " +
                             std::to_string(rules.max_length),
                         "value_too_long"};
    }
    if (value.find('\0') != std::string::npos) {
        return GateError{ErrorCategory::InputShape,
                         rules.field_label + " contains null bytes",
                         "null_byte"};
    }

    if (!rules.enforce_shell_safety) {
        return value;
    }
    for (const auto& sequence : shell_sequences_) {
        if (value.find(sequence) == std::string::npos) {
            continue;
        }
        return GateError{ErrorCategory::Injection,
                         rules.field_label +
                             " contains forbidden character sequence: " +
                             printable(sequence),
                         "forbidden_sequence",
                         "Remove shell metacharacters such as ; | & $ from the value."};
    }

    return value;
}

}  // namespace cmdgate::policy
