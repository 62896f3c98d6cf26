#include <gtest/gtest.h>
#include "commands/Cli.hpp"
#include "commands/CommandRegistry.hpp"
#include "fakes/RecordingTransport.hpp"

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* kBaseUrl = "http://keystore.test";

// Captures the request exactly as the flags left it
class ObservingOverride : public CliOverride {
public:
    explicit ObservingOverride(std::shared_ptr<RecordingTransport> transport = nullptr)
        : transport(std::move(transport)) {}

    OverrideResult executeKeyGet(const CommandOptions&, sdk::builder::KeyGet& request) const override {
        calls++;
        seenKey = request.getKey();
        seenUniqueKey = request.getUniqueKey();
        if (transport) {
            sentBeforeOverride = transport->callCount();
        }
        return std::nullopt;
    }

    std::shared_ptr<RecordingTransport> transport;
    mutable int calls = 0;
    mutable std::optional<bool> seenKey;
    mutable std::optional<std::string> seenUniqueKey;
    mutable size_t sentBeforeOverride = 0;
};

class ReplacingOverride : public CliOverride {
public:
    OverrideResult executeKeyGet(const CommandOptions&, sdk::builder::KeyGet& request) const override {
        request.uniqueKey("from-override");
        return std::nullopt;
    }
};

class RefusingOverride : public CliOverride {
public:
    OverrideResult executeKeyGet(const CommandOptions&, sdk::builder::KeyGet&) const override {
        return std::string("unique key must match key");
    }
};

// Fills the path parameter from a flag the generated schema does not declare
class SecondaryFlagOverride : public CliOverride {
public:
    OverrideResult executeKeyPut(const CommandOptions& options, sdk::builder::KeyPut& request) const override {
        if (!request.getName()) {
            if (auto alias = options.find<std::string>("alias")) {
                request.name(*alias);
            }
        }
        return std::nullopt;
    }
};

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<RecordingTransport>();
    }

    sdk::Client client() const {
        sdk::ClientConfig config;
        config.base_url = kBaseUrl;
        return sdk::Client(config, transport);
    }

    CLI::App_p parse(CliCommand command, const std::string& line) const {
        CLI::App_p app = CommandRegistry::getCommand(command);
        app->parse(line, false);
        return app;
    }

    std::shared_ptr<RecordingTransport> transport;
    std::ostringstream out;
};

TEST_F(DispatcherTest, KeyGetAppliesSuppliedFlags) {
    CLI::App_p app = parse(CliCommand::KeyGet, "--key=true --unique-key=abc");
    Cli<ObservingOverride> cli(client(), ObservingOverride(transport), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    const ObservingOverride& over = cli.getOverride();
    EXPECT_EQ(over.calls, 1);
    EXPECT_EQ(over.seenKey, std::optional<bool>(true));
    EXPECT_EQ(over.seenUniqueKey, std::optional<std::string>("abc"));
    EXPECT_EQ(over.sentBeforeOverride, 0u);

    auto requests = transport->getRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "GET");
    EXPECT_EQ(requests[0].url, "http://keystore.test/key?key=true&unique_key=abc");
    EXPECT_EQ(out.str().rfind("success\n", 0), 0u);
}

TEST_F(DispatcherTest, KeyGetWithoutFlagsLeavesFieldsUnset) {
    CLI::App_p app = parse(CliCommand::KeyGet, "");
    Cli<ObservingOverride> cli(client(), ObservingOverride(), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    EXPECT_FALSE(cli.getOverride().seenKey.has_value());
    EXPECT_FALSE(cli.getOverride().seenUniqueKey.has_value());

    auto requests = transport->getRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "http://keystore.test/key");
    EXPECT_EQ(out.str(),
              "success\n"
              "ResponseValue {\n"
              "    inner: Empty,\n"
              "    status: 200,\n"
              "    headers: {content-type: application/json},\n"
              "}\n");
}

TEST_F(DispatcherTest, OnlySuppliedFlagIsSet) {
    CLI::App_p app = parse(CliCommand::KeyGet, "--unique-key xyz");
    Cli<ObservingOverride> cli(client(), ObservingOverride(), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    EXPECT_FALSE(cli.getOverride().seenKey.has_value());
    EXPECT_EQ(cli.getOverride().seenUniqueKey, std::optional<std::string>("xyz"));
    EXPECT_EQ(transport->getRequests().at(0).url, "http://keystore.test/key?unique_key=xyz");
}

TEST_F(DispatcherTest, OverrideWinsOverFlagValue) {
    CLI::App_p app = parse(CliCommand::KeyGet, "--key=false --unique-key=abc");
    Cli<ReplacingOverride> cli(client(), ReplacingOverride(), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    EXPECT_EQ(transport->getRequests().at(0).url,
              "http://keystore.test/key?key=false&unique_key=from-override");
}

TEST_F(DispatcherTest, DefaultOverrideLeavesRequestAsFlagsBuiltIt) {
    CLI::App_p app = parse(CliCommand::KeyGet, "--key=true --unique-key=abc");
    Cli<> cli(client(), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    EXPECT_EQ(transport->getRequests().at(0).url, "http://keystore.test/key?key=true&unique_key=abc");
}

TEST_F(DispatcherTest, RefusingOverrideAbortsBeforeSend) {
    CLI::App_p app = parse(CliCommand::KeyGet, "--key=true");
    Cli<RefusingOverride> cli(client(), RefusingOverride(), out);

    try {
        cli.execute(CliCommand::KeyGet, CommandOptions(*app));
        FAIL() << "expected OverrideError";
    } catch (const OverrideError& e) {
        EXPECT_EQ(e.getCommand(), CliCommand::KeyGet);
        EXPECT_STREQ(e.what(), "override for key-get failed: unique key must match key");
    }

    EXPECT_EQ(transport->callCount(), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatcherTest, RequestFailureIsReportedUnderSuccessLabel) {
    transport->enqueue(503, R"({"request_id":"r-1","error_code":"Unavailable","message":"try later"})");
    CLI::App_p app = parse(CliCommand::KeyGet, "");
    Cli<> cli(client(), out);

    cli.execute(CliCommand::KeyGet, CommandOptions(*app));

    const std::string text = out.str();
    EXPECT_EQ(text.rfind("success\nError::ErrorResponse(ResponseValue {", 0), 0u);
    EXPECT_NE(text.find("status: 503"), std::string::npos);
    EXPECT_NE(text.find("\"try later\""), std::string::npos);
}

TEST_F(DispatcherTest, MissingPathParameterIsReportedWithoutCallingService) {
    CLI::App_p app = parse(CliCommand::KeyPut, "--value v");
    Cli<> cli(client(), out);

    cli.execute(CliCommand::KeyPut, CommandOptions(*app));

    EXPECT_EQ(transport->callCount(), 0u);
    EXPECT_EQ(out.str(), "success\nError::InvalidRequest(\"name was not initialized\")\n");
}

TEST_F(DispatcherTest, OverrideCanReadFlagsOutsideTheGeneratedSchema) {
    transport->enqueue(200, R"({"name":"beta","value":"v"})");
    CLI::App_p app = CommandRegistry::getCommand(CliCommand::KeyPut);
    app->add_option("--alias")->description("Alternative spelling of --name");
    app->parse("--alias beta --value v", false);
    Cli<SecondaryFlagOverride> cli(client(), SecondaryFlagOverride(), out);

    cli.execute(CliCommand::KeyPut, CommandOptions(*app));

    auto requests = transport->getRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].url, "http://keystore.test/key/beta");
    EXPECT_NE(out.str().find("KeyEntry { name: \"beta\", value: \"v\", ttl_seconds: none }"), std::string::npos);
}

TEST_F(DispatcherTest, KeyListAndKeyDeleteDispatch) {
    transport->enqueue(200, R"({"items":[],"next_page":null})");
    transport->enqueue(204, "", "text/plain");
    Cli<> cli(client(), out);

    CLI::App_p list = parse(CliCommand::KeyList, "--limit 10 --page-token t1");
    cli.execute(CliCommand::KeyList, CommandOptions(*list));
    CLI::App_p remove = parse(CliCommand::KeyDelete, "--name alpha");
    cli.execute(CliCommand::KeyDelete, CommandOptions(*remove));

    auto requests = transport->getRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].url, "http://keystore.test/keys?limit=10&page_token=t1");
    EXPECT_EQ(requests[1].method, "DELETE");
    EXPECT_EQ(requests[1].url, "http://keystore.test/key/alpha");
    EXPECT_NE(out.str().find("KeyPage { items: [], next_page: none }"), std::string::npos);
    EXPECT_NE(out.str().find("status: 204"), std::string::npos);
}

TEST_F(DispatcherTest, NonUtf8BodyIsStillReported) {
    transport->enqueue(302, "<html>caf\xe9</html>", "text/html");
    CLI::App_p app = parse(CliCommand::KeyGet, "");
    Cli<> cli(client(), out);

    EXPECT_NO_THROW(cli.execute(CliCommand::KeyGet, CommandOptions(*app)));

    EXPECT_EQ(out.str().rfind("success\nError::UnexpectedResponse(status 302: ", 0), 0u);
    EXPECT_NE(out.str().find("caf\xef\xbf\xbd"), std::string::npos);
}

TEST_F(DispatcherTest, NonUtf8FlagValueIsSent) {
    transport->enqueue(200, R"({"name":"a","value":"v"})");
    CLI::App_p app = CommandRegistry::getCommand(CliCommand::KeyPut);
    // CLI11 takes the vector form in reverse order
    std::vector<std::string> args = {"caf\xe9", "--value", "a", "--name"};
    app->parse(args);
    Cli<> cli(client(), out);

    EXPECT_NO_THROW(cli.execute(CliCommand::KeyPut, CommandOptions(*app)));

    ASSERT_EQ(transport->callCount(), 1u);
    EXPECT_EQ(out.str().rfind("success\nResponseValue {", 0), 0u);
}
