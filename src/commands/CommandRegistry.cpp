#include "CommandRegistry.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace {

CLI::App_p makeCommand(CliCommand command) {
    return std::make_shared<CLI::App>(CliCommands::about(command), CliCommands::name(command));
}

template <typename T>
CLI::Option* addFlag(CLI::App& app, const std::string& name, const std::string& type_name,
                     const std::string& help) {
    CLI::Option* opt = app.add_option("--" + name)->description(help)->type_name(type_name)->required(false);
    if constexpr (!std::is_same_v<T, std::string>) {
        // Reject values that would not convert when the dispatcher reads them back
        opt->check(CLI::TypeValidator<T>(std::string()));
    }
    return opt;
}

} // namespace

CLI::App_p CommandRegistry::getCommand(CliCommand command) {
    switch (command) {
    case CliCommand::KeyGet:
        return cliKeyGet();
    case CliCommand::KeyList:
        return cliKeyList();
    case CliCommand::KeyPut:
        return cliKeyPut();
    case CliCommand::KeyDelete:
        return cliKeyDelete();
    }
    throw std::logic_error("Unhandled command in CommandRegistry::getCommand");
}

CLI::App_p CommandRegistry::cliKeyGet() {
    auto app = makeCommand(CliCommand::KeyGet);
    addFlag<bool>(*app, "key", "BOOL",
                  "The same key as in the path. It's important to make sure this is the same or "
                  "things won't work!");
    addFlag<std::string>(*app, "unique-key", "TEXT",
                         "A key parameter that will not be overridden by the path spec");
    return app;
}

CLI::App_p CommandRegistry::cliKeyList() {
    auto app = makeCommand(CliCommand::KeyList);
    addFlag<uint32_t>(*app, "limit", "UINT", "Maximum number of items returned by a single call");
    addFlag<std::string>(*app, "page-token", "TEXT", "Token returned by previous call to retrieve the subsequent page");
    return app;
}

CLI::App_p CommandRegistry::cliKeyPut() {
    auto app = makeCommand(CliCommand::KeyPut);
    addFlag<std::string>(*app, "name", "TEXT", "Name of the key to write");
    addFlag<std::string>(*app, "value", "TEXT", "Value stored under the key");
    addFlag<int64_t>(*app, "ttl-seconds", "INT", "Seconds until the key expires; omit to keep it forever");
    return app;
}

CLI::App_p CommandRegistry::cliKeyDelete() {
    auto app = makeCommand(CliCommand::KeyDelete);
    addFlag<std::string>(*app, "name", "TEXT", "Name of the key to delete");
    return app;
}
