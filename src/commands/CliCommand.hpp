#pragma once
#include <optional>
#include <string>
#include <vector>

// One value per operation of the keystore API. Adding a value requires a
// schema in CommandRegistry and an execute routine in Cli; both switch over
// this enum without a default label.
enum class CliCommand {
    KeyGet,
    KeyList,
    KeyPut,
    KeyDelete,
};

class CliCommands {
public:
    // Every command exactly once, in declaration order
    static const std::vector<CliCommand>& all();

    // Sub-command name as typed on the command line, e.g. "key-get"
    static std::string name(CliCommand command);
    static std::string about(CliCommand command);
    static std::optional<CliCommand> fromName(const std::string& name);
};
