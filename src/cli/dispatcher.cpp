//! # CLI Command Dispatcher
//!
//! Wires the host together and runs one command per invocation.
//!
//! ## Architecture
//!
//! ```text
//! pjsk_main()
//!   ├─ help, --help, -h      → print_usage()
//!   ├─ version, -V           → print_version()
//!   ├─ draw / adjust / select → RenderCoordinator (commit, then render)
//!   ├─ list                  → RenderCoordinator::list()
//!   ├─ show / forget         → RenderCoordinator
//!   ├─ cleanup               → RenderCoordinator::cleanup()
//!   └─ dump                  → DurableStore::get_all()
//! ```
//!
//! The CLI has no image backend: it renders through a `NullRenderer`, so
//! each command still runs the whole commit-then-render pipeline. State
//! survives between invocations through the durable tier.
//!
//! ## Return Codes
//!
//! | Code | Meaning                                         |
//! |------|-------------------------------------------------|
//! | 0    | Success                                         |
//! | 1    | Error reply, bad option, or unusable config     |

#include "card/vocabulary.hpp"
#include "common.hpp"
#include "config/card_config.hpp"
#include "driver.hpp"
#include "json/json_value.hpp"
#include "log/log.hpp"
#include "render/render_coordinator.hpp"
#include "render/renderer.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace pjsk::cli {

namespace {

auto print_reply(const render::Reply& reply) -> int {
    auto text = reply.to_plain_text();
    if (reply.is_error) {
        std::cerr << text << "\n";
        return 1;
    }
    std::cout << text << "\n";
    return 0;
}

/// Applies `[logging]` from the config file unless argv or PJSK_LOG already
/// chose.
void apply_logging_config(const CliOptions& options, char* argv[],
                          const config::LoggingSettings& settings) {
    if (options.log_level_explicit && (options.log_file_explicit || settings.file.empty())) {
        return;
    }
    auto log_config = log::parse_log_options(options.command_index, argv);
    if (!options.log_level_explicit) {
        log_config.level = log::parse_level(settings.level);
    }
    if (!options.log_file_explicit && !settings.file.empty()) {
        log_config.log_file = settings.file;
    }
    log::Logger::init(log_config);
}

auto run_dump(const render::RenderCoordinator& coordinator) -> int {
    const auto* durable = coordinator.durable();
    if (!durable) {
        std::cerr << "persistence is disabled, nothing to dump\n";
        return 1;
    }
    json::JsonObject entries;
    for (const auto& [key, snapshot] : durable->get_all()) {
        entries.emplace(key, snapshot.to_json());
    }
    std::cout << json::JsonValue(std::move(entries)).to_string_pretty(2) << "\n";
    return 0;
}

} // namespace

} // namespace pjsk::cli

/// Main entry point for the pjsk CLI.
///
/// Parses the options before the command, loads the configuration, builds
/// the coordinator and dispatches on the command name. Arguments after the
/// command form the message.
int pjsk_main(int argc, char* argv[]) {
    using namespace pjsk;
    using namespace pjsk::cli;

    auto parsed = parse_cli_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        print_usage();
        return 1;
    }
    auto& options = unwrap(parsed);

    if (options.command.empty() || options.command == "help") {
        print_usage();
        return 0;
    }
    if (options.command == "version") {
        print_version();
        return 0;
    }

    log::Logger::init(log::parse_log_options(options.command_index, argv));

    config::CardConfig card_config;
    if (options.config_explicit) {
        auto loaded = config::CardConfig::load(options.config_path);
        if (is_err(loaded)) {
            std::cerr << "error: " << unwrap_err(loaded).to_string() << "\n";
            return 1;
        }
        card_config = std::move(unwrap(loaded));
    } else {
        card_config = config::CardConfig::load_or_default(options.config_path);
    }
    apply_logging_config(options, argv, card_config.logging);

    auto catalog = card_config.build_catalog();
    if (is_err(catalog)) {
        std::cerr << "error: ambiguous persona alias: " << unwrap_err(catalog).to_string()
                  << "\n";
        return 1;
    }
    auto vocabulary = card::CommandVocabulary::build(card::VocabularyGroups::builtin());
    if (is_err(vocabulary)) {
        std::cerr << "error: ambiguous command alias: " << unwrap_err(vocabulary).to_string()
                  << "\n";
        return 1;
    }

    render::RendererHandle renderer(make_box<render::NullRenderer>());
    Box<session::DurableStore> durable;
    if (card_config.persistence.enabled) {
        durable = make_box<session::DurableStore>(card_config.persistence.storage_path);
    }

    render::RenderCoordinator coordinator(
        card_config.coordinator_settings(),
        make_rc<const card::CommandVocabulary>(std::move(unwrap(vocabulary))),
        make_rc<const card::PersonaCatalog>(std::move(unwrap(catalog))), renderer,
        std::move(durable));

    const auto& requester = options.requester;
    std::string message = join_args(options.args);
    const auto& command = options.command;
    PJSK_LOG_DEBUG("cli", "Running '" << command << "' with message '" << message << "'");

    int status = 0;
    if (command == "draw") {
        status = print_reply(coordinator.draw(requester, message));
    } else if (command == "adjust") {
        status = print_reply(coordinator.adjust(requester, message));
    } else if (command == "list") {
        status = print_reply(coordinator.list(message));
    } else if (command == "select") {
        status = print_reply(coordinator.select(requester, message));
    } else if (command == "show") {
        status = print_reply(coordinator.show(requester));
    } else if (command == "forget") {
        status = print_reply(coordinator.forget(requester));
    } else if (command == "cleanup") {
        auto report = coordinator.cleanup();
        std::cout << "Removed " << report.expired_entries << " expired card(s) and "
                  << report.expired_flows << " expired selection flow(s)\n";
    } else if (command == "dump") {
        status = run_dump(coordinator);
    } else {
        std::cerr << "error: unknown command '" << command << "'\n\n";
        print_usage();
        status = 1;
    }

    renderer.close();
    log::Logger::instance().flush();
    return status;
}
