#pragma once
#include "CliCommand.hpp"
#include <CLI/CLI.hpp>

// Flag schemas for every CliCommand. Each call builds a new sub-command app
// named after the command; the caller registers it with a parent parser.
class CommandRegistry {
public:
    static CLI::App_p getCommand(CliCommand command);

    static CLI::App_p cliKeyGet();
    static CLI::App_p cliKeyList();
    static CLI::App_p cliKeyPut();
    static CLI::App_p cliKeyDelete();
};
