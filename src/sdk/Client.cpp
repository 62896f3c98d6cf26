#include "Client.hpp"
#include "CurlTransport.hpp"
#include "../utils/UrlUtils.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace sdk {

Client::Client(ClientConfig config)
    : config(config), transport(std::make_shared<CurlTransport>(config.timeout_seconds)) {}

Client::Client(ClientConfig config, std::shared_ptr<Transport> transport)
    : config(std::move(config)), transport(std::move(transport)) {
    if (!this->transport) {
        throw std::invalid_argument("Client requires a transport");
    }
}

builder::KeyGet Client::keyGet() const {
    return builder::KeyGet(*this);
}

builder::KeyList Client::keyList() const {
    return builder::KeyList(*this);
}

builder::KeyPut Client::keyPut() const {
    return builder::KeyPut(*this);
}

builder::KeyDelete Client::keyDelete() const {
    return builder::KeyDelete(*this);
}

std::string Client::url(const std::string& path) const {
    return UrlUtils::joinPath(config.base_url, path);
}

HttpResponse Client::perform(const HttpRequest& request) const {
    if (config.verbose) {
        std::cerr << "[keystore] " << request.method << " " << request.url << std::endl;
    }
    HttpResponse response = transport->perform(request);
    if (config.verbose) {
        std::cerr << "[keystore] " << request.method << " " << request.url
                  << " -> " << response.status << std::endl;
    }
    return response;
}

} // namespace sdk
