#pragma once

#include <filesystem>
#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::config {

// Allow entries: [A-Za-z0-9_-]+, at most 50 chars.
bool is_valid_allowed_entry(const std::string& entry);

// Deny entries: a command, or a command and one subcommand separated by
// one or more spaces; at most 101 chars.
bool is_valid_denied_entry(const std::string& entry);

// "stats   realtime" -> "stats realtime"
std::string canonical_denied_entry(const std::string& entry);

// Newline-delimited; blank lines and '#' comments are skipped. Any bad
// line fails the whole load with its line number. An empty result is an error.
core::errors::Result<core::config::CommandSet> load_allowed_commands_file(
    const std::filesystem::path& path);

// Same line rules; a file holding only comments yields an empty set.
core::errors::Result<core::config::CommandSet> load_denied_commands_file(
    const std::filesystem::path& path);

// Comma-separated; tokens are trimmed and empty tokens skipped.
core::errors::Result<core::config::CommandSet> parse_allowed_commands(
    const std::string& list);

core::errors::Result<core::config::CommandSet> parse_denied_commands(
    const std::string& list);

}  // namespace cmdgate::config
