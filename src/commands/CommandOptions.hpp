#pragma once
#include <CLI/CLI.hpp>
#include <optional>
#include <stdexcept>
#include <string>

// Read-only view of one parsed sub-command. Flags are looked up by long name
// without the leading dashes ("unique-key"), whether they were generated or
// added to the sub-command by an embedder.
class CommandOptions {
public:
    explicit CommandOptions(const CLI::App& command) : command(&command) {}

    bool has(const std::string& name) const {
        const CLI::Option* opt = option(name);
        return opt != nullptr && opt->count() > 0;
    }

    template <typename T>
    std::optional<T> find(const std::string& name) const {
        if (!has(name)) {
            return std::nullopt;
        }
        return option(name)->as<T>();
    }

    template <typename T>
    T get(const std::string& name) const {
        std::optional<T> value = find<T>(name);
        if (!value) {
            throw std::runtime_error("Option --" + name + " was not supplied");
        }
        return *value;
    }

    const CLI::App& getCommand() const { return *command; }

private:
    const CLI::Option* option(const std::string& name) const {
        return command->get_option_no_throw("--" + name);
    }

    const CLI::App* command;
};
