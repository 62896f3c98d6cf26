#pragma once
#include <map>
#include <stdexcept>
#include <string>

namespace sdk {

struct HttpRequest {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;  // names are lower-cased
    std::string body;
};

// Thrown by a transport when no HTTP response could be obtained at all
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class Transport {
public:
    virtual ~Transport() = default;

    // Must be safe to call from several threads at once
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

} // namespace sdk
