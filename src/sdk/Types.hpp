#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdk {

// Response type for operations that document no body
struct Empty {};

struct KeyEntry {
    std::string name;
    std::string value;
    std::optional<int64_t> ttl_seconds;
};

struct KeyPage {
    std::vector<KeyEntry> items;
    std::optional<std::string> next_page;
};

// Body of every 4xx/5xx response the service sends
struct ApiError {
    std::string request_id;
    std::optional<std::string> error_code;
    std::string message;
};

void to_json(nlohmann::json& j, const KeyEntry& entry);
void from_json(const nlohmann::json& j, KeyEntry& entry);
void to_json(nlohmann::json& j, const KeyPage& page);
void from_json(const nlohmann::json& j, KeyPage& page);
void from_json(const nlohmann::json& j, ApiError& error);

// JSON-quoted rendering of a string; bytes that are not valid UTF-8 become U+FFFD
std::string quoted(const std::string& value);

std::ostream& operator<<(std::ostream& os, const Empty& empty);
std::ostream& operator<<(std::ostream& os, const KeyEntry& entry);
std::ostream& operator<<(std::ostream& os, const KeyPage& page);
std::ostream& operator<<(std::ostream& os, const ApiError& error);

} // namespace sdk
