#include "config/gate_config_loader.hpp"

#include "config/list_loader.hpp"
#include "core/logging/logger.hpp"

namespace cmdgate::config {

using core::config::CommandSet;
using core::config::GateConfig;

namespace {

using FileLoader = core::errors::Result<CommandSet> (*)(const std::filesystem::path&);
using InlineParser = core::errors::Result<CommandSet> (*)(const std::string&);

core::errors::Result<std::optional<CommandSet>> merge_sources(
    const std::optional<std::filesystem::path>& file,
    const std::optional<std::string>& inline_list, const FileLoader load_file,
    const InlineParser parse_inline, const std::string& kind) {
    std::optional<CommandSet> merged;

    if (file.has_value()) {
        auto loaded = load_file(file.value());
        if (core::errors::is_error(loaded)) {
            return core::errors::get_error(loaded);
        }
        merged = core::errors::get_value(loaded);
    }

    if (inline_list.has_value()) {
        auto parsed = parse_inline(inline_list.value());
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        const auto& inline_commands = core::errors::get_value(parsed);
        if (!merged.has_value()) {
            merged = inline_commands;
            CMDGATE_LOG_INFO("Loaded " + std::to_string(inline_commands.size()) + " " +
                             kind + " commands from command line");
        } else {
            merged->insert(inline_commands.begin(), inline_commands.end());
            CMDGATE_LOG_INFO("Added " + std::to_string(inline_commands.size()) + " " +
                             kind + " commands from command line (total: " +
                             std::to_string(merged->size()) + ")");
        }
    }

    return merged;
}

}  // namespace

core::errors::Result<GateConfig> load_gate_config(const ListSources& sources) {
    auto allowed = merge_sources(sources.allowed_commands_file, sources.allowed_commands,
                                 &load_allowed_commands_file, &parse_allowed_commands,
                                 "allowed");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    auto denied = merge_sources(sources.denied_commands_file, sources.denied_commands,
                                &load_denied_commands_file, &parse_denied_commands,
                                "denied");
    if (core::errors::is_error(denied)) {
        return core::errors::get_error(denied);
    }

    GateConfig config;
    config.dialect = sources.dialect;
    config.custom_allow_set = core::errors::get_value(allowed);
    config.custom_deny_set = core::errors::get_value(denied);
    config.use_default_allow_set = !config.custom_allow_set.has_value();
    return config;
}

}  // namespace cmdgate::config
