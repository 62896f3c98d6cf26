#include "CliCommand.hpp"

const std::vector<CliCommand>& CliCommands::all() {
    static const std::vector<CliCommand> commands = {
        CliCommand::KeyGet,
        CliCommand::KeyList,
        CliCommand::KeyPut,
        CliCommand::KeyDelete,
    };
    return commands;
}

std::string CliCommands::name(CliCommand command) {
    switch (command) {
    case CliCommand::KeyGet:
        return "key-get";
    case CliCommand::KeyList:
        return "key-list";
    case CliCommand::KeyPut:
        return "key-put";
    case CliCommand::KeyDelete:
        return "key-delete";
    }
    return "";
}

std::string CliCommands::about(CliCommand command) {
    switch (command) {
    case CliCommand::KeyGet:
        return "Look up a key by query parameters";
    case CliCommand::KeyList:
        return "List stored keys, one page at a time";
    case CliCommand::KeyPut:
        return "Create or replace a key";
    case CliCommand::KeyDelete:
        return "Delete a key";
    }
    return "";
}

std::optional<CliCommand> CliCommands::fromName(const std::string& name) {
    for (CliCommand command : all()) {
        if (CliCommands::name(command) == name) {
            return command;
        }
    }
    return std::nullopt;
}
