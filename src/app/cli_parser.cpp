#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cmdgate::app::cli {

    using namespace cmdgate::core::errors;
    using cmdgate::protocol::GateInvocation;
    using cmdgate::protocol::GateMode;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> request;
            std::optional<std::string> allowed_commands_file;
            std::optional<std::string> allowed_commands;
            std::optional<std::string> denied_commands_file;
            std::optional<std::string> denied_commands;
            std::optional<std::string> dialect;
            bool verbose = false;
        };

        GateError input_error(const std::string& message, const std::string& code, const std::string& hint = "") {
            return GateError{ErrorCategory::Config, message, code, hint};
        }

        // Reads the value after a flag; each flag may appear only once.
        std::optional<GateError> take_value(const std::vector<std::string>& args, size_t& i,
                                            std::optional<std::string>& slot, const std::string& hint) {
            const std::string& flag = args[i];
            if (slot.has_value()) {
                return input_error(flag + " specified multiple times", "duplicate_flag");
            }
            if (i + 1 >= args.size()) {
                return input_error("Missing value for " + flag, "missing_value", hint);
            }
            slot = args[++i];
            return std::nullopt;
        }

    } // namespace

    Result<GateInvocation> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command",
                               "Usage: cmdgate check --request '{\"command\":\"service\",\"args\":[\"list\"]}'");
        }

        GateInvocation invocation;
        const std::string command = argv[1];
        if (command == "check") {
            invocation.mode = GateMode::Check;
        } else if (command == "streaming") {
            invocation.mode = GateMode::Streaming;
        } else if (command == "list-commands") {
            invocation.mode = GateMode::ListCommands;
        } else {
            return input_error("Unknown command: " + command, "unknown_command",
                               "Supported commands: check, streaming, list-commands.");
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and subcommand
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<GateError> err;
            if (args[i] == "--request") {
                err = take_value(args, i, raw.request, "Provide the command request as a JSON object.");
            } else if (args[i] == "--allowed-commands-file") {
                err = take_value(args, i, raw.allowed_commands_file, "Provide a file path.");
            } else if (args[i] == "--allowed-commands") {
                err = take_value(args, i, raw.allowed_commands, "Provide a comma-separated list of commands.");
            } else if (args[i] == "--denied-commands-file") {
                err = take_value(args, i, raw.denied_commands_file, "Provide a file path.");
            } else if (args[i] == "--denied-commands") {
                err = take_value(args, i, raw.denied_commands, "Provide a comma-separated list of commands.");
            } else if (args[i] == "--dialect") {
                err = take_value(args, i, raw.dialect, "Use posix or windows.");
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return input_error("Unknown argument: " + args[i], "unknown_argument");
            }
            if (err.has_value()) {
                return err.value();
            }
        }

        // 3. Validator Phase: Enforce mode requirements
        invocation.verbose = raw.verbose;

        if (invocation.mode == GateMode::ListCommands) {
            if (raw.request.has_value()) {
                return input_error("list-commands does not take --request", "unexpected_flag");
            }
        } else if (!raw.request.has_value() || raw.request->empty()) {
            return input_error("Must provide --request", "missing_required_flag",
                               "Pass the command request as a JSON object.");
        }
        invocation.request_json = raw.request;

        if (raw.dialect) {
            const auto dialect = core::config::dialect_from_string(raw.dialect.value());
            if (!dialect.has_value()) {
                return input_error("Invalid value for --dialect: " + raw.dialect.value(), "invalid_dialect",
                                   "Use posix or windows.");
            }
            invocation.list_sources.dialect = dialect.value();
        }

        if (raw.allowed_commands_file) invocation.list_sources.allowed_commands_file = std::filesystem::path(raw.allowed_commands_file.value());
        if (raw.allowed_commands) invocation.list_sources.allowed_commands = raw.allowed_commands;
        if (raw.denied_commands_file) invocation.list_sources.denied_commands_file = std::filesystem::path(raw.denied_commands_file.value());
        if (raw.denied_commands) invocation.list_sources.denied_commands = raw.denied_commands;

        return invocation;
    }

} // namespace cmdgate::app::cli
