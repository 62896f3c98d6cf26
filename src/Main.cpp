#include "commands/CliCommand.hpp"
#include "manager/CommandManager.hpp"
#include "sdk/CurlTransport.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        sdk::CurlGlobal curl;

        CommandManager manager;
        for (CliCommand command : CliCommands::all()) {
            manager.registerCommand(command);
        }

        return manager.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return CommandManager::kExitFailure;
    }
}
