#include "utils.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <iostream>

namespace pjsk::cli {

namespace {

auto value_of(std::string_view arg, std::string_view prefix) -> std::optional<std::string> {
    if (arg.starts_with(prefix)) {
        return std::string(arg.substr(prefix.size()));
    }
    return std::nullopt;
}

auto sets_log_level(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || arg == "-v" || arg == "-vv" ||
           arg == "-vvv";
}

} // namespace

auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;
    options.command_index = argc;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (!arg.starts_with("-")) {
            options.command = std::string(arg);
            options.command_index = i;
            for (int j = i + 1; j < argc; ++j) {
                options.args.emplace_back(argv[j]);
            }
            break;
        }

        if (arg == "--help" || arg == "-h") {
            options.command = "help";
            options.command_index = i;
            break;
        }
        if (arg == "--version" || arg == "-V") {
            options.command = "version";
            options.command_index = i;
            break;
        }

        if (auto v = value_of(arg, "--config=")) {
            options.config_path = *v;
            options.config_explicit = true;
        } else if (auto v = value_of(arg, "--channel=")) {
            options.requester.channel = *v;
        } else if (auto v = value_of(arg, "--session=")) {
            options.requester.session_id = *v;
        } else if (auto v = value_of(arg, "--user=")) {
            options.requester.sender_id = *v;
        } else if (auto v = value_of(arg, "--name=")) {
            options.requester.sender_name = *v;
        } else if (log::is_log_option(arg)) {
            if (sets_log_level(arg)) {
                options.log_level_explicit = true;
            }
            if (arg.starts_with("--log-file=")) {
                options.log_file_explicit = true;
            }
        } else {
            return "unknown option: " + std::string(arg);
        }
    }

    if (const char* env = std::getenv("PJSK_LOG"); env && *env) {
        options.log_level_explicit = true;
    }
    if (!options.requester.sender_name) {
        if (const char* user = std::getenv("USER"); user && *user) {
            options.requester.sender_name = user;
        }
    }
    return options;
}

auto join_args(const std::vector<std::string>& args) -> std::string {
    std::string message;
    for (const auto& arg : args) {
        if (!message.empty()) {
            message += ' ';
        }
        bool needs_quotes = arg.find_first_of(" \t\n") != std::string::npos &&
                            arg.find('"') == std::string::npos;
        if (needs_quotes) {
            message += '"' + arg + '"';
        } else {
            message += arg;
        }
    }
    return message;
}

void print_usage() {
    std::cout << "pjsk " << VERSION << " - Project SEKAI style card state engine\n\n";
    std::cout << "Usage: pjsk [options] <command> [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  draw [text | flags]   Create or refresh the card\n";
    std::cout << "                        flags: -n <text> -s <size> -l <spacing> -c\n";
    std::cout << "                               -x <x> -y <y> -r <persona|random> --daf\n";
    std::cout << "  adjust [command]      Adjust the card (no command: usage)\n";
    std::cout << "  list [all|groups|expand <name>]\n";
    std::cout << "                        Browse personas\n";
    std::cout << "  select [n | name]     Choose a persona by number or name\n";
    std::cout << "  show                  Print the current card\n";
    std::cout << "  forget                Delete the current card\n";
    std::cout << "  cleanup               Remove expired stored cards\n";
    std::cout << "  dump                  Print every stored card as JSON\n";
    std::cout << "  help                  Show this help\n";
    std::cout << "  version               Show the version\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config=<file>       Configuration file (default " << DEFAULT_CONFIG_PATH
              << ")\n";
    std::cout << "  --channel=<id>        Originating channel (default " << DEFAULT_CHANNEL
              << ")\n";
    std::cout << "  --session=<id>        Explicit session id\n";
    std::cout << "  --user=<id>           Sender id\n";
    std::cout << "  --name=<name>         Sender display name (default $USER)\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. store=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also write logs to a file\n";
    std::cout << "  --log-format=json     Structured log lines\n";
    std::cout << "  -v, -vv, -vvv, -q     Verbosity shortcuts\n";
}

void print_version() {
    std::cout << "pjsk " << VERSION << "\n";
}

} // namespace pjsk::cli
