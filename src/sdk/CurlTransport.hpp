#pragma once
#include "Transport.hpp"

namespace sdk {

// Owns curl_global_init/curl_global_cleanup for the lifetime of the process
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class CurlTransport : public Transport {
public:
    explicit CurlTransport(long timeout_seconds);

    HttpResponse perform(const HttpRequest& request) override;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    // userp is the std::map<std::string, std::string> collecting lower-cased headers
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp);

private:

    long timeout_seconds;
};

} // namespace sdk
