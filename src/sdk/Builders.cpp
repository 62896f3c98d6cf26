#include "Builders.hpp"
#include "Client.hpp"
#include "../utils/UrlUtils.hpp"
#include <type_traits>
#include <utility>
#include <vector>

namespace sdk {

namespace {

template <typename T>
T decodeBody(const std::string& body) {
    if constexpr (std::is_same_v<T, Empty>) {
        return Empty{};
    } else {
        return nlohmann::json::parse(body).get<T>();
    }
}

// Maps a raw HTTP response onto the operation's documented outcomes
template <typename T>
Result<T> decodeResponse(HttpResponse response, long expected_status) {
    if (response.status == expected_status) {
        try {
            T inner = decodeBody<T>(response.body);
            return ResponseValue<T>(std::move(inner), response.status, std::move(response.headers));
        } catch (const nlohmann::json::exception& e) {
            return Error::invalidResponsePayload(response.status, e.what());
        }
    }

    if (response.status >= 400 && response.status < 600) {
        try {
            ApiError inner = nlohmann::json::parse(response.body).get<ApiError>();
            return Error::errorResponse(
                ResponseValue<ApiError>(std::move(inner), response.status, std::move(response.headers)));
        } catch (const nlohmann::json::exception& e) {
            return Error::invalidResponsePayload(response.status, e.what());
        }
    }

    return Error::unexpectedResponse(response.status, response.body);
}

template <typename T>
Result<T> invoke(const Client& client, const HttpRequest& request, long expected_status) {
    HttpResponse response;
    try {
        response = client.perform(request);
    } catch (const TransportError& e) {
        return Error::communication(e.what());
    }
    return decodeResponse<T>(std::move(response), expected_status);
}

HttpRequest makeRequest(const std::string& method, std::string url) {
    HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.headers["accept"] = "application/json";
    return request;
}

} // namespace

namespace builder {

KeyGet::KeyGet(const Client& client) : client(&client) {}

KeyGet& KeyGet::key(bool value) {
    key_ = value;
    return *this;
}

KeyGet& KeyGet::uniqueKey(std::string value) {
    unique_key_ = std::move(value);
    return *this;
}

std::future<Result<Empty>> KeyGet::send() const {
    return std::async(std::launch::async, [request = *this]() -> Result<Empty> {
        std::vector<std::pair<std::string, std::string>> query;
        if (request.key_) {
            query.emplace_back("key", *request.key_ ? "true" : "false");
        }
        if (request.unique_key_) {
            query.emplace_back("unique_key", *request.unique_key_);
        }

        const Client& client = *request.client;
        return invoke<Empty>(client, makeRequest("GET", client.url("/key") + UrlUtils::buildQuery(query)), 200);
    });
}

KeyList::KeyList(const Client& client) : client(&client) {}

KeyList& KeyList::limit(uint32_t value) {
    limit_ = value;
    return *this;
}

KeyList& KeyList::pageToken(std::string value) {
    page_token_ = std::move(value);
    return *this;
}

std::future<Result<KeyPage>> KeyList::send() const {
    return std::async(std::launch::async, [request = *this]() -> Result<KeyPage> {
        std::vector<std::pair<std::string, std::string>> query;
        if (request.limit_) {
            query.emplace_back("limit", std::to_string(*request.limit_));
        }
        if (request.page_token_) {
            query.emplace_back("page_token", *request.page_token_);
        }

        const Client& client = *request.client;
        return invoke<KeyPage>(client, makeRequest("GET", client.url("/keys") + UrlUtils::buildQuery(query)), 200);
    });
}

KeyPut::KeyPut(const Client& client) : client(&client) {}

KeyPut& KeyPut::name(std::string value) {
    name_ = std::move(value);
    return *this;
}

KeyPut& KeyPut::value(std::string value) {
    value_ = std::move(value);
    return *this;
}

KeyPut& KeyPut::ttlSeconds(int64_t value) {
    ttl_seconds_ = value;
    return *this;
}

std::future<Result<KeyEntry>> KeyPut::send() const {
    return std::async(std::launch::async, [request = *this]() -> Result<KeyEntry> {
        if (!request.name_) {
            return Error::invalidRequest("name was not initialized");
        }
        if (!request.value_) {
            return Error::invalidRequest("value was not initialized");
        }

        nlohmann::json body = {{"value", *request.value_}};
        if (request.ttl_seconds_) {
            body["ttl_seconds"] = *request.ttl_seconds_;
        }

        const Client& client = *request.client;
        HttpRequest http = makeRequest("PUT", client.url("/key/" + UrlUtils::urlEncode(*request.name_)));
        http.headers["content-type"] = "application/json";
        http.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return invoke<KeyEntry>(client, http, 200);
    });
}

KeyDelete::KeyDelete(const Client& client) : client(&client) {}

KeyDelete& KeyDelete::name(std::string value) {
    name_ = std::move(value);
    return *this;
}

std::future<Result<Empty>> KeyDelete::send() const {
    return std::async(std::launch::async, [request = *this]() -> Result<Empty> {
        if (!request.name_) {
            return Error::invalidRequest("name was not initialized");
        }

        const Client& client = *request.client;
        return invoke<Empty>(client, makeRequest("DELETE", client.url("/key/" + UrlUtils::urlEncode(*request.name_))), 204);
    });
}

} // namespace builder
} // namespace sdk
