#include "CurlTransport.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace sdk {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(long timeout_seconds) : timeout_seconds(timeout_seconds) {}

size_t CurlTransport::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

size_t CurlTransport::headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, size * nitems);

    // Interim (1xx) and followed-redirect responses each start with a status
    // line; only the headers of the last response are kept
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * nitems;
    }

    // The blank terminator carries no colon
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = trim(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[name] = trim(line.substr(colon + 1));
    }
    return size * nitems;
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("Failed to create curl handle");
    }

    HttpResponse response;

    std::unique_ptr<curl_slist, CurlListDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw TransportError("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(std::string(curl_easy_strerror(res)));
    }

    if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
        throw TransportError("Failed to read response status");
    }
    return response;
}

} // namespace sdk
