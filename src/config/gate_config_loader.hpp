#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::config {

// Where custom allow/deny lists come from at startup.
struct ListSources {
    std::optional<std::filesystem::path> allowed_commands_file;
    std::optional<std::string> allowed_commands;
    std::optional<std::filesystem::path> denied_commands_file;
    std::optional<std::string> denied_commands;
    core::config::PlatformDialect dialect = core::config::host_dialect();
};

// File and inline sources of the same kind are unioned; the union then
// replaces that kind's defaults. A kind with no source keeps its defaults.
core::errors::Result<core::config::GateConfig> load_gate_config(const ListSources& sources);

}  // namespace cmdgate::config
