#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace cmdgate::core::config {

    // Ordered so listings come out sorted.
    using CommandSet = std::set<std::string>;

    // Field limits shared by the validators and the list loaders.
    constexpr std::size_t kMaxCommandLength = 50;
    constexpr std::size_t kMaxArgLength = 100;
    constexpr std::size_t kMaxFlagNameLength = 50;
    constexpr std::size_t kMaxFlagValueLength = 500;
    constexpr std::size_t kMaxPathLength = 256;
    constexpr std::size_t kMaxDeniedEntryLength = kMaxCommandLength * 2 + 1;

    // Selects the extended shell metacharacters and the Windows filename rules.
    enum class PlatformDialect {
        Posix,
        Windows
    };

    constexpr PlatformDialect host_dialect() {
#if defined(_WIN32)
        return PlatformDialect::Windows;
#else
        return PlatformDialect::Posix;
#endif
    }

    inline std::string to_string(const PlatformDialect dialect) {
        switch (dialect) {
            case PlatformDialect::Posix:   return "posix";
            case PlatformDialect::Windows: return "windows";
            default: return "unknown";
        }
    }

    inline std::optional<PlatformDialect> dialect_from_string(const std::string& value) {
        if (value == "posix") return PlatformDialect::Posix;
        if (value == "windows") return PlatformDialect::Windows;
        return std::nullopt;
    }

    // Engine construction value. A custom set replaces the defaults, it is never merged.
    struct GateConfig {
        bool use_default_allow_set = true;
        std::optional<CommandSet> custom_allow_set;
        std::optional<CommandSet> custom_deny_set;
        PlatformDialect dialect = host_dialect();
    };

} // namespace cmdgate::core::config
