#include "config/list_loader.hpp"

#include <fstream>
#include <sstream>
#include <vector>
#include "core/logging/logger.hpp"

namespace cmdgate::config {

using core::config::CommandSet;
using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

struct ListRules {
    std::string kind;  // "allowed" or "denied"
    std::size_t max_length;
    bool (*is_valid)(const std::string&);
    bool empty_file_is_error;
    bool canonicalize;
};

const ListRules kAllowedRules{"allowed", core::config::kMaxCommandLength,
                              &is_valid_allowed_entry, true, false};
const ListRules kDeniedRules{"denied", core::config::kMaxDeniedEntryLength,
                             &is_valid_denied_entry, false, true};

bool is_token_char(const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool is_token(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (const char c : text) {
        if (!is_token_char(c)) {
            return false;
        }
    }
    return true;
}

bool is_space(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string store_form(const ListRules& rules, const std::string& entry) {
    return rules.canonicalize ? canonical_denied_entry(entry) : entry;
}

core::errors::Result<CommandSet> load_list_file(const std::filesystem::path& path,
                                                const ListRules& rules) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Internal,
                         "failed to open " + rules.kind + " commands file: " +
                             path.string(),
                         "list_open_failed"};
    }

    CommandSet commands;
    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.size() > rules.max_length) {
            return GateError{ErrorCategory::Config,
                             "command on line " + std::to_string(line_no) +
                                 " exceeds maximum length of " +
                                 std::to_string(rules.max_length) + " characters",
                             "list_entry_too_long"};
        }
        if (!rules.is_valid(line)) {
            return GateError{ErrorCategory::Config,
                             "invalid command format on line " +
                                 std::to_string(line_no) + ": " + line,
                             "invalid_list_entry"};
        }
        commands.insert(store_form(rules, line));
    }
    if (in.bad()) {
        return GateError{ErrorCategory::Internal,
                         "error reading " + rules.kind + " commands file: " +
                             path.string(),
                         "list_read_failed"};
    }

    if (commands.empty() && rules.empty_file_is_error) {
        return GateError{ErrorCategory::Config, "no valid commands found in file",
                         "empty_list"};
    }

    CMDGATE_LOG_INFO("Loaded " + std::to_string(commands.size()) + " " + rules.kind +
                     " commands from " + path.string());
    return commands;
}

core::errors::Result<CommandSet> parse_list(const std::string& list,
                                            const ListRules& rules) {
    if (list.empty()) {
        return GateError{ErrorCategory::Config,
                         rules.kind + " commands list is empty", "empty_list"};
    }

    CommandSet commands;
    std::istringstream in(list);
    std::string raw;
    while (std::getline(in, raw, ',')) {
        const std::string token = trim(raw);
        if (token.empty()) {
            continue;
        }
        if (token.size() > rules.max_length) {
            return GateError{ErrorCategory::Config,
                             "command '" + token + "' exceeds maximum length of " +
                                 std::to_string(rules.max_length) + " characters",
                             "list_entry_too_long"};
        }
        if (!rules.is_valid(token)) {
            return GateError{ErrorCategory::Config,
                             "invalid command format: " + token,
                             "invalid_list_entry"};
        }
        commands.insert(store_form(rules, token));
    }

    if (commands.empty()) {
        return GateError{ErrorCategory::Config, "no valid commands found in list",
                         "empty_list"};
    }
    return commands;
}

}  // namespace

bool is_valid_allowed_entry(const std::string& entry) {
    return entry.size() <= core::config::kMaxCommandLength && is_token(entry);
}

bool is_valid_denied_entry(const std::string& entry) {
    if (entry.size() > core::config::kMaxDeniedEntryLength) {
        return false;
    }
    const auto space = entry.find(' ');
    if (space == std::string::npos) {
        return is_token(entry);
    }
    const auto next = entry.find_first_not_of(' ', space);
    if (next == std::string::npos) {
        return false;
    }
    return is_token(entry.substr(0, space)) && is_token(entry.substr(next));
}

std::string canonical_denied_entry(const std::string& entry) {
    const auto space = entry.find(' ');
    if (space == std::string::npos) {
        return entry;
    }
    const auto next = entry.find_first_not_of(' ', space);
    if (next == std::string::npos) {
        return entry.substr(0, space);
    }
    return entry.substr(0, space) + " " + entry.substr(next);
}

core::errors::Result<CommandSet> load_allowed_commands_file(
    const std::filesystem::path& path) {
    return load_list_file(path, kAllowedRules);
}

core::errors::Result<CommandSet> load_denied_commands_file(
    const std::filesystem::path& path) {
    return load_list_file(path, kDeniedRules);
}

core::errors::Result<CommandSet> parse_allowed_commands(const std::string& list) {
    return parse_list(list, kAllowedRules);
}

core::errors::Result<CommandSet> parse_denied_commands(const std::string& list) {
    return parse_list(list, kDeniedRules);
}

}  // namespace cmdgate::config
