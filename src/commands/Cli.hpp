#pragma once
#include "CliCommand.hpp"
#include "CliOverride.hpp"
#include "CommandOptions.hpp"
#include "../sdk/Client.hpp"
#include <cstdint>
#include <iostream>
#include <ostream>
#include <type_traits>
#include <utility>

// Runs one CliCommand end to end: fresh builder, parsed flags, override,
// send, report. Override must derive from CliOverride; the default applies
// no customization.
template <typename Override = CliOverride>
class Cli {
    static_assert(std::is_base_of_v<CliOverride, Override>, "Override must derive from CliOverride");

public:
    explicit Cli(sdk::Client client, std::ostream& out = std::cout)
        : client(std::move(client)), over(), out(&out) {}

    Cli(sdk::Client client, Override over, std::ostream& out = std::cout)
        : client(std::move(client)), over(std::move(over)), out(&out) {}

    // Throws OverrideError if the command's override refuses the request.
    // Request failures are reported, not thrown.
    void execute(CliCommand command, const CommandOptions& options) const {
        switch (command) {
        case CliCommand::KeyGet:
            executeKeyGet(options);
            return;
        case CliCommand::KeyList:
            executeKeyList(options);
            return;
        case CliCommand::KeyPut:
            executeKeyPut(options);
            return;
        case CliCommand::KeyDelete:
            executeKeyDelete(options);
            return;
        }
    }

    void executeKeyGet(const CommandOptions& options) const {
        auto request = client.keyGet();
        if (auto value = options.find<bool>("key")) {
            request.key(*value);
        }
        if (auto value = options.find<std::string>("unique-key")) {
            request.uniqueKey(*value);
        }
        checkOverride(CliCommand::KeyGet, over.executeKeyGet(options, request));
        report(request.send().get());
    }

    void executeKeyList(const CommandOptions& options) const {
        auto request = client.keyList();
        if (auto value = options.find<uint32_t>("limit")) {
            request.limit(*value);
        }
        if (auto value = options.find<std::string>("page-token")) {
            request.pageToken(*value);
        }
        checkOverride(CliCommand::KeyList, over.executeKeyList(options, request));
        report(request.send().get());
    }

    void executeKeyPut(const CommandOptions& options) const {
        auto request = client.keyPut();
        if (auto value = options.find<std::string>("name")) {
            request.name(*value);
        }
        if (auto value = options.find<std::string>("value")) {
            request.value(*value);
        }
        if (auto value = options.find<int64_t>("ttl-seconds")) {
            request.ttlSeconds(*value);
        }
        checkOverride(CliCommand::KeyPut, over.executeKeyPut(options, request));
        report(request.send().get());
    }

    void executeKeyDelete(const CommandOptions& options) const {
        auto request = client.keyDelete();
        if (auto value = options.find<std::string>("name")) {
            request.name(*value);
        }
        checkOverride(CliCommand::KeyDelete, over.executeKeyDelete(options, request));
        report(request.send().get());
    }

    const Override& getOverride() const { return over; }

private:
    static void checkOverride(CliCommand command, const OverrideResult& result) {
        if (result) {
            throw OverrideError(command, *result);
        }
    }

    // Both outcomes carry the "success" label; only the rendered value differs
    template <typename T>
    void report(const sdk::Result<T>& result) const {
        if (result.isOk()) {
            *out << "success\n" << result.value() << std::endl;
        } else {
            *out << "success\n" << result.error() << std::endl;
        }
    }

    sdk::Client client;
    Override over;
    std::ostream* out;
};
