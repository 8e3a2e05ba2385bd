#include "cli_options.hpp"

namespace waypoint::app {

using namespace waypoint::core;

std::string usage() {
    return
        "Usage: waypoint [--config <path>] [--verbose] <command>\n"
        "\n"
        "Commands:\n"
        "  new                         Create a session from the state template\n"
        "  show <session>              Print a session's state as JSON\n"
        "  commit <session> <diff>     Merge a JSON diff file into a session\n"
        "  clear <session>             Remove a session's state and chat history\n"
        "  help                        Show this message\n";
}

Result<CliOptions, Error> parse_cli(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return Result<CliOptions, Error>::err(ErrorCode::InvalidArgument, "Missing value for --config");
            }
            options.config_path = std::filesystem::path(args[++i]);
        } else if (args[i] == "--verbose" || args[i] == "-v") {
            options.verbose = true;
        } else if (args[i] == "--help" || args[i] == "-h") {
            options.command = Command::Help;
            return Result<CliOptions, Error>::ok(std::move(options));
        } else if (args[i].rfind("--", 0) == 0) {
            return Result<CliOptions, Error>::err(ErrorCode::InvalidArgument, "Unknown argument: " + args[i]);
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.empty()) {
        return Result<CliOptions, Error>::err(ErrorCode::InvalidArgument, "No command provided");
    }

    const auto& command = positional[0];
    size_t expected = 1;

    if (command == "new") {
        options.command = Command::New;
    } else if (command == "show") {
        options.command = Command::Show;
        expected = 2;
    } else if (command == "commit") {
        options.command = Command::Commit;
        expected = 3;
    } else if (command == "clear") {
        options.command = Command::Clear;
        expected = 2;
    } else if (command == "help") {
        options.command = Command::Help;
    } else {
        return Result<CliOptions, Error>::err(ErrorCode::InvalidArgument, "Unknown command: " + command);
    }

    if (positional.size() != expected) {
        return Result<CliOptions, Error>::err(
            ErrorCode::InvalidArgument,
            "Wrong number of arguments for " + command,
            std::to_string(positional.size() - 1)
        );
    }

    if (expected >= 2) {
        options.session_id = positional[1];
    }
    if (expected == 3) {
        options.diff_file = positional[2];
    }

    return Result<CliOptions, Error>::ok(std::move(options));
}

}  // namespace waypoint::app
