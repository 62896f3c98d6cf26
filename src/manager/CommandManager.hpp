#pragma once

#include "../commands/Cli.hpp"
#include "../commands/CliCommand.hpp"
#include "../commands/CliOverride.hpp"
#include "../commands/CommandOptions.hpp"
#include "../sdk/Client.hpp"
#include "../sdk/Transport.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Client configuration that cannot be used (missing or malformed base URL)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Owns the root parser: global options, one sub-command per registered
// CliCommand, and the hand-off of the selected sub-command to Cli.
class CommandManager {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitConfig = 2;
    static constexpr int kExitOverrideFailed = 3;

    // A null transport means requests go through libcurl
    explicit CommandManager(std::shared_ptr<sdk::Transport> transport = nullptr,
                            std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void registerCommand(CliCommand command);

    // Registered sub-command, for embedders that add flags of their own.
    // Throws std::out_of_range if the command was never registered.
    CLI::App& getCommand(CliCommand command);
    CLI::App& getApp() { return app; }

    template <typename Override = CliOverride>
    int run(int argc, const char* const* argv, Override over = Override{});

private:
    std::optional<int> parse(int argc, const char* const* argv);
    CliCommand selectedCommand() const;
    sdk::Client makeClient() const;

    CLI::App app;
    std::map<CliCommand, CLI::App*> commands;

    std::string base_url;
    long timeout_seconds = 30;
    bool verbose = false;

    std::shared_ptr<sdk::Transport> transport;
    std::ostream* out;
    std::ostream* err;
};

template <typename Override>
int CommandManager::run(int argc, const char* const* argv, Override over) {
    if (auto code = parse(argc, argv)) {
        return *code;
    }

    try {
        CliCommand command = selectedCommand();
        Cli<Override> cli(makeClient(), std::move(over), *out);
        cli.execute(command, CommandOptions(getCommand(command)));
    } catch (const ConfigError& e) {
        *err << "[keystore] " << e.what() << std::endl;
        return kExitConfig;
    } catch (const OverrideError& e) {
        *err << "fatal: " << e.what() << std::endl;
        return kExitOverrideFailed;
    } catch (const std::exception& e) {
        *err << "Error executing command: " << e.what() << std::endl;
        return kExitFailure;
    }
    return kExitSuccess;
}
