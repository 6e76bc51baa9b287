#include "policy/path_safety.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace cmdgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr std::array<std::string_view, 13> kPathShellSequences = {
    ";", "&", "|", "`", "$", "(", ")", "{", "}", "<", ">", "\n", "\r"};

constexpr std::array<std::string_view, 22> kReservedDeviceNames = {
    "CON",  "PRN",  "AUX",  "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

constexpr std::string_view kWindowsInvalidChars = "<>:\"|?*";

std::string printable(const std::string_view sequence) {
    if (sequence == "\n") return "\\n";
    if (sequence == "\r") return "\\r";
    return std::string(sequence);
}

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

// Final segment under Windows separator rules ('/' and '\\').
std::string final_segment(const std::string& path) {
    const auto sep = path.find_last_of("/\\");
    if (sep == std::string::npos) {
        return path;
    }
    return path.substr(sep + 1);
}

// "con.txt" -> "CON"; only the last extension is dropped.
std::string device_stem(const std::string& segment) {
    return uppercase(segment.substr(0, segment.rfind('.')));
}

bool has_drive_prefix(const std::string& path) {
    return path.size() >= 2 && path[1] == ':' &&
           PathSafetyChecker::is_drive_letter(path[0]);
}

GateError platform_error(std::string message, std::string code) {
    return GateError{ErrorCategory::PlatformPath, std::move(message), std::move(code),
                     "Use a plain relative or drive-letter path with ordinary file names."};
}

}  // namespace

PathSafetyChecker::PathSafetyChecker(const core::config::PlatformDialect dialect)
    : dialect_(dialect) {}

bool PathSafetyChecker::is_drive_letter(const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool PathSafetyChecker::is_reserved_device_name(const std::string& segment) {
    const std::string stem = device_stem(segment);
    return std::find(kReservedDeviceNames.begin(), kReservedDeviceNames.end(), stem) !=
           kReservedDeviceNames.end();
}

core::errors::Result<std::string> PathSafetyChecker::check_path(
    const std::string& path) const {
    if (path.size() > core::config::kMaxPathLength) {
        return GateError{ErrorCategory::InputShape,
                         "path exceeds maximum length of " +
                             std::to_string(core::config::kMaxPathLength),
                         "value_too_long"};
    }
    if (path.find('\0') != std::string::npos) {
        return GateError{ErrorCategory::InputShape, "path contains null bytes",
                         "null_byte"};
    }
    if (path.find("..") != std::string::npos) {
        return GateError{ErrorCategory::Traversal, "path traversal detected",
                         "path_traversal",
                         "Remove '..' sequences from the path."};
    }
    for (const auto sequence : kPathShellSequences) {
        if (path.find(sequence) == std::string::npos) {
            continue;
        }
        return GateError{ErrorCategory::Injection,
                         "path contains forbidden character: " + printable(sequence),
                         "forbidden_sequence"};
    }

    if (dialect_ == core::config::PlatformDialect::Windows) {
        return check_windows_path(path);
    }
    return path;
}

core::errors::Result<std::string> PathSafetyChecker::check_windows_path(
    const std::string& path) const {
    if (path.rfind("\\\\", 0) == 0) {
        return platform_error("UNC paths are not allowed", "unc_path");
    }

    const auto colons = std::count(path.begin(), path.end(), ':');
    if (colons > 1) {
        return platform_error("alternate data streams are not allowed",
                              "alternate_data_stream");
    }
    if (colons == 1 && !has_drive_prefix(path)) {
        return platform_error(
            "invalid use of colon in path: alternate data streams are not allowed",
            "invalid_colon");
    }

    const std::string rest = has_drive_prefix(path) ? path.substr(2) : path;
    const std::string base = final_segment(rest);
    if (is_reserved_device_name(base)) {
        const std::string stem = device_stem(base);
        return platform_error("reserved device name '" + stem + "' is not allowed",
                              "reserved_device_name");
    }

    for (const char c : kWindowsInvalidChars) {
        if (rest.find(c) == std::string::npos) {
            continue;
        }
        return platform_error(std::string("invalid Windows filename character: ") + c,
                              "invalid_filename_character");
    }

    // Windows silently strips these, so "name." and "name" would alias.
    // Only the bare "." path is exempt; "dir\\." normalizes to "dir".
    if (!base.empty() && rest != "." && (base.back() == '.' || base.back() == ' ')) {
        return platform_error("path contains trailing dots or spaces",
                              "trailing_dot_or_space");
    }

    return path;
}

}  // namespace cmdgate::policy
