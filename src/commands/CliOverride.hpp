#pragma once
#include "CliCommand.hpp"
#include "CommandOptions.hpp"
#include "../sdk/Builders.hpp"
#include <optional>
#include <stdexcept>
#include <string>

// std::nullopt on success, otherwise a description of why the request was refused
using OverrideResult = std::optional<std::string>;

// Per-command customization hook. Each method runs after the parsed flags
// have been applied to the request and before it is sent, and may read any
// option or call any setter. Override only the commands you care about.
class CliOverride {
public:
    virtual ~CliOverride() = default;

    virtual OverrideResult executeKeyGet(const CommandOptions&, sdk::builder::KeyGet&) const {
        return std::nullopt;
    }
    virtual OverrideResult executeKeyList(const CommandOptions&, sdk::builder::KeyList&) const {
        return std::nullopt;
    }
    virtual OverrideResult executeKeyPut(const CommandOptions&, sdk::builder::KeyPut&) const {
        return std::nullopt;
    }
    virtual OverrideResult executeKeyDelete(const CommandOptions&, sdk::builder::KeyDelete&) const {
        return std::nullopt;
    }
};

// Raised by Cli when an override refuses a request. Nothing in the dispatch
// layer catches it.
class OverrideError : public std::runtime_error {
public:
    OverrideError(CliCommand command, const std::string& message)
        : std::runtime_error("override for " + CliCommands::name(command) + " failed: " + message),
          command(command) {}

    CliCommand getCommand() const { return command; }

private:
    CliCommand command;
};
