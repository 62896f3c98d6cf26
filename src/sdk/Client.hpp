#pragma once
#include "Builders.hpp"
#include "Transport.hpp"
#include <memory>
#include <string>

namespace sdk {

struct ClientConfig {
    std::string base_url;
    long timeout_seconds = 30;
    bool verbose = false;  // log each request line to stderr
};

class Client {
public:
    // Uses a CurlTransport built from the config
    explicit Client(ClientConfig config);
    Client(ClientConfig config, std::shared_ptr<Transport> transport);

    builder::KeyGet keyGet() const;
    builder::KeyList keyList() const;
    builder::KeyPut keyPut() const;
    builder::KeyDelete keyDelete() const;

    const ClientConfig& getConfig() const { return config; }
    std::string url(const std::string& path) const;

    HttpResponse perform(const HttpRequest& request) const;

private:
    ClientConfig config;
    std::shared_ptr<Transport> transport;
};

} // namespace sdk
