#include "CommandManager.hpp"
#include "../commands/CommandRegistry.hpp"

CommandManager::CommandManager(std::shared_ptr<sdk::Transport> transport, std::ostream& out, std::ostream& err)
    : app("Command-line client for the keystore service", "keystore"),
      transport(std::move(transport)), out(&out), err(&err) {
    app.add_option("--base-url", base_url, "Base URL of the keystore service, e.g. http://localhost:8080")
        ->envname("KEYSTORE_BASE_URL");
    app.add_option("--timeout-seconds", timeout_seconds, "Connect and total timeout for each request")
        ->envname("KEYSTORE_TIMEOUT_SECONDS")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_flag("--verbose", verbose, "Log each request to stderr");
    app.require_subcommand(1);
}

void CommandManager::registerCommand(CliCommand command) {
    if (commands.count(command) != 0) {
        throw std::logic_error("Command registered twice: " + CliCommands::name(command));
    }
    // Sub-apps built outside this parser do not inherit fallthrough; without it
    // global options after the command name are rejected as extras
    CLI::App* sub = app.add_subcommand(CommandRegistry::getCommand(command));
    sub->fallthrough();
    commands[command] = sub;
}

CLI::App& CommandManager::getCommand(CliCommand command) {
    return *commands.at(command);
}

std::optional<int> CommandManager::parse(int argc, const char* const* argv) {
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, *out, *err);
    }
    return std::nullopt;
}

CliCommand CommandManager::selectedCommand() const {
    for (const auto& [command, sub] : commands) {
        if (sub->parsed()) {
            return command;
        }
    }
    throw std::logic_error("No registered command was parsed");
}

sdk::Client CommandManager::makeClient() const {
    if (base_url.empty()) {
        throw ConfigError("no base URL configured; pass --base-url or set KEYSTORE_BASE_URL");
    }
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        throw ConfigError("base URL must start with http:// or https://: " + base_url);
    }

    sdk::ClientConfig config;
    config.base_url = base_url;
    config.timeout_seconds = timeout_seconds;
    config.verbose = verbose;

    if (transport) {
        return sdk::Client(config, transport);
    }
    return sdk::Client(config);
}
