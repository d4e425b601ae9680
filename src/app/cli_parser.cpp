#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace pokeme::app::cli {

    using namespace pokeme::core::errors;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> positionals;
        std::optional<std::string> port;
        std::optional<std::string> timeout;
        std::optional<std::string> idle_timeout;
        std::optional<std::string> question;
        std::optional<std::string> context;
        std::optional<std::string> agent;
        std::optional<std::string> task;
        std::optional<std::string> comment;
        std::set<std::string> seen_flags;
        bool verbose = false;
    };

    std::optional<CommandKind> parse_command(const std::string& name) {
        if (name == "serve") return CommandKind::Serve;
        if (name == "ask") return CommandKind::Ask;
        if (name == "permit") return CommandKind::Permit;
        if (name == "status") return CommandKind::Status;
        if (name == "answer") return CommandKind::Answer;
        if (name == "approve") return CommandKind::Approve;
        if (name == "deny") return CommandKind::Deny;
        if (name == "shutdown") return CommandKind::Shutdown;
        return std::nullopt;
    }

    std::set<std::string> allowed_flags(CommandKind kind) {
        std::set<std::string> flags = {"--port", "--verbose"};
        switch (kind) {
            case CommandKind::Serve:
                flags.insert("--idle-timeout");
                break;
            case CommandKind::Ask:
                flags.insert({"--context", "--agent", "--task", "--timeout"});
                break;
            case CommandKind::Permit:
                flags.insert({"--question", "--context", "--agent", "--task", "--timeout"});
                break;
            case CommandKind::Approve:
            case CommandKind::Deny:
                flags.insert("--comment");
                break;
            default:
                break;
        }
        return flags;
    }

    std::size_t expected_positionals(CommandKind kind) {
        switch (kind) {
            case CommandKind::Ask:
            case CommandKind::Permit:
            case CommandKind::Approve:
            case CommandKind::Deny:
                return 1;
            case CommandKind::Answer:
                return 2;
            default:
                return 0;
        }
    }

    // Exception-free integer parsing
    Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                        std::uint32_t min_value, std::uint32_t max_value) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return BrokerError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min_value || value > max_value) {
            return BrokerError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                               "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
        }
        return value;
    }

    } // namespace

    std::string usage() {
        return "Usage: pokeme <command> [options]\n"
               "  serve     [--port N] [--idle-timeout S] [--verbose]\n"
               "  ask       <question> [--context C] [--agent A] [--task T] [--timeout S] [--port N]\n"
               "  permit    <command> [--question Q] [--context C] [--agent A] [--task T] [--timeout S] [--port N]\n"
               "  status    [--port N]\n"
               "  answer    <id> <text> [--port N]\n"
               "  approve   <id> [--comment C] [--port N]\n"
               "  deny      <id> [--comment C] [--port N]\n"
               "  shutdown  [--port N]";
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BrokerError{ErrorCategory::Input, "No command provided.", "missing_command_name", usage()};
        }

        const std::string name = argv[1];
        const auto kind = parse_command(name);
        if (!kind) {
            return BrokerError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](std::size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            std::string flag = args[i];
            if (flag == "-c") flag = "--context";
            else if (flag == "-a") flag = "--agent";
            else if (flag == "-t") flag = "--task";
            else if (flag == "-q") flag = "--question";

            if (flag.rfind("-", 0) != 0 || flag == "-") {
                raw.positionals.push_back(args[i]);
                continue;
            }

            std::optional<std::string>* slot = nullptr;
            if (flag == "--port") slot = &raw.port;
            else if (flag == "--timeout") slot = &raw.timeout;
            else if (flag == "--idle-timeout") slot = &raw.idle_timeout;
            else if (flag == "--question") slot = &raw.question;
            else if (flag == "--context") slot = &raw.context;
            else if (flag == "--agent") slot = &raw.agent;
            else if (flag == "--task") slot = &raw.task;
            else if (flag == "--comment") slot = &raw.comment;

            if (flag == "--verbose") {
                raw.verbose = true;
            } else if (slot == nullptr) {
                return BrokerError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else if (!take_value(i, *slot)) {
                return BrokerError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            raw.seen_flags.insert(flag);
        }

        // 3. Validator Phase: Enforce logic and bounds
        const auto allowed = allowed_flags(*kind);
        for (const auto& flag : raw.seen_flags) {
            if (allowed.count(flag) == 0) {
                return BrokerError{ErrorCategory::Input, flag + " is not valid for '" + name + "'", "unknown_argument"};
            }
        }

        const std::size_t expected = expected_positionals(*kind);
        if (raw.positionals.size() < expected) {
            return BrokerError{ErrorCategory::Input, "Missing argument for '" + name + "'", "missing_argument", usage()};
        }
        if (raw.positionals.size() > expected) {
            return BrokerError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals[expected], "unknown_argument"};
        }

        CliCommand cmd;
        cmd.kind = *kind;
        cmd.verbose = raw.verbose;

        if (raw.port) {
            const std::uint32_t min_port = (*kind == CommandKind::Serve) ? 0 : 1;
            auto port = parse_bounded("--port", raw.port.value(), min_port, 65535);
            if (is_error(port)) return get_error(port);
            cmd.port = static_cast<std::uint16_t>(get_value(port));
        }
        if (raw.timeout) {
            auto timeout = parse_bounded("--timeout", raw.timeout.value(), 1, 86400);
            if (is_error(timeout)) return get_error(timeout);
            cmd.timeout = std::chrono::seconds(get_value(timeout));
        }
        if (raw.idle_timeout) {
            auto idle = parse_bounded("--idle-timeout", raw.idle_timeout.value(), 1, 86400);
            if (is_error(idle)) return get_error(idle);
            cmd.idle_timeout = std::chrono::seconds(get_value(idle));
        }

        switch (*kind) {
            case CommandKind::Ask:
                cmd.request.question = raw.positionals[0];
                cmd.request.request_type = protocol::RequestType::Question;
                break;
            case CommandKind::Permit:
                cmd.request.question = raw.question.value_or("Allow this command?");
                cmd.request.command = raw.positionals[0];
                cmd.request.request_type = protocol::RequestType::Permission;
                break;
            case CommandKind::Answer:
                cmd.request_id = raw.positionals[0];
                cmd.answer_text = raw.positionals[1];
                break;
            case CommandKind::Approve:
            case CommandKind::Deny:
                cmd.request_id = raw.positionals[0];
                cmd.comment = raw.comment.value_or("");
                break;
            default:
                break;
        }
        cmd.request.context = raw.context;
        cmd.request.agent = raw.agent;
        cmd.request.task = raw.task;

        return cmd;
    }

} // namespace pokeme::app::cli
