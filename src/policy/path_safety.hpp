#pragma once

#include <string>
#include "core/config/gate_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace cmdgate::policy {

// Path-traversal and filename-legality checks for caller-supplied paths.
//
// Any literal ".." is rejected, even inside a filename such as "a..b".
// Unicode lookalikes of '.' and '/' are not treated as traversal.
// The Windows dialect adds UNC, colon/ADS, device-name, illegal-character
// and trailing dot/space rules.
class PathSafetyChecker {
public:
    explicit PathSafetyChecker(
        core::config::PlatformDialect dialect = core::config::host_dialect());

    core::errors::Result<std::string> check_path(const std::string& path) const;

    core::config::PlatformDialect dialect() const { return dialect_; }

    static bool is_drive_letter(char c);
    static bool is_reserved_device_name(const std::string& segment);

private:
    core::errors::Result<std::string> check_windows_path(const std::string& path) const;

    core::config::PlatformDialect dialect_;
};

}  // namespace cmdgate::policy
