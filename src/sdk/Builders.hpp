#pragma once
#include "Result.hpp"
#include "Types.hpp"
#include <cstdint>
#include <future>
#include <optional>
#include <string>

namespace sdk {

class Client;

namespace builder {

// Builders hold a pointer to the Client that created them; the client must
// outlive both the builder and any future returned by send().

// GET /key
class KeyGet {
public:
    explicit KeyGet(const Client& client);

    KeyGet& key(bool value);
    KeyGet& uniqueKey(std::string value);

    const std::optional<bool>& getKey() const { return key_; }
    const std::optional<std::string>& getUniqueKey() const { return unique_key_; }

    std::future<Result<Empty>> send() const;

private:
    const Client* client;
    std::optional<bool> key_;
    std::optional<std::string> unique_key_;
};

// GET /keys
class KeyList {
public:
    explicit KeyList(const Client& client);

    KeyList& limit(uint32_t value);
    KeyList& pageToken(std::string value);

    const std::optional<uint32_t>& getLimit() const { return limit_; }
    const std::optional<std::string>& getPageToken() const { return page_token_; }

    std::future<Result<KeyPage>> send() const;

private:
    const Client* client;
    std::optional<uint32_t> limit_;
    std::optional<std::string> page_token_;
};

// PUT /key/{name}
class KeyPut {
public:
    explicit KeyPut(const Client& client);

    KeyPut& name(std::string value);
    KeyPut& value(std::string value);
    KeyPut& ttlSeconds(int64_t value);

    const std::optional<std::string>& getName() const { return name_; }
    const std::optional<std::string>& getValue() const { return value_; }
    const std::optional<int64_t>& getTtlSeconds() const { return ttl_seconds_; }

    std::future<Result<KeyEntry>> send() const;

private:
    const Client* client;
    std::optional<std::string> name_;
    std::optional<std::string> value_;
    std::optional<int64_t> ttl_seconds_;
};

// DELETE /key/{name}
class KeyDelete {
public:
    explicit KeyDelete(const Client& client);

    KeyDelete& name(std::string value);

    const std::optional<std::string>& getName() const { return name_; }

    std::future<Result<Empty>> send() const;

private:
    const Client* client;
    std::optional<std::string> name_;
};

} // namespace builder
} // namespace sdk
