#include "Types.hpp"

namespace sdk {

namespace {

void writeOptional(std::ostream& os, const std::optional<std::string>& value) {
    if (value) {
        os << quoted(*value);
    } else {
        os << "none";
    }
}

void writeOptional(std::ostream& os, const std::optional<int64_t>& value) {
    if (value) {
        os << *value;
    } else {
        os << "none";
    }
}

} // namespace

std::string quoted(const std::string& value) {
    return nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void to_json(nlohmann::json& j, const KeyEntry& entry) {
    j = nlohmann::json{{"name", entry.name}, {"value", entry.value}};
    if (entry.ttl_seconds) {
        j["ttl_seconds"] = *entry.ttl_seconds;
    }
}

void from_json(const nlohmann::json& j, KeyEntry& entry) {
    j.at("name").get_to(entry.name);
    j.at("value").get_to(entry.value);
    if (j.contains("ttl_seconds") && !j["ttl_seconds"].is_null()) {
        entry.ttl_seconds = j["ttl_seconds"].get<int64_t>();
    } else {
        entry.ttl_seconds.reset();
    }
}

void to_json(nlohmann::json& j, const KeyPage& page) {
    j = nlohmann::json{{"items", page.items}};
    if (page.next_page) {
        j["next_page"] = *page.next_page;
    }
}

void from_json(const nlohmann::json& j, KeyPage& page) {
    j.at("items").get_to(page.items);
    if (j.contains("next_page") && !j["next_page"].is_null()) {
        page.next_page = j["next_page"].get<std::string>();
    } else {
        page.next_page.reset();
    }
}

void from_json(const nlohmann::json& j, ApiError& error) {
    j.at("request_id").get_to(error.request_id);
    j.at("message").get_to(error.message);
    if (j.contains("error_code") && !j["error_code"].is_null()) {
        error.error_code = j["error_code"].get<std::string>();
    } else {
        error.error_code.reset();
    }
}

std::ostream& operator<<(std::ostream& os, const Empty&) {
    return os << "Empty";
}

std::ostream& operator<<(std::ostream& os, const KeyEntry& entry) {
    os << "KeyEntry { name: " << quoted(entry.name)
       << ", value: " << quoted(entry.value)
       << ", ttl_seconds: ";
    writeOptional(os, entry.ttl_seconds);
    return os << " }";
}

std::ostream& operator<<(std::ostream& os, const KeyPage& page) {
    os << "KeyPage { items: [";
    for (size_t i = 0; i < page.items.size(); i++) {
        os << (i == 0 ? "" : ", ") << page.items[i];
    }
    os << "], next_page: ";
    writeOptional(os, page.next_page);
    return os << " }";
}

std::ostream& operator<<(std::ostream& os, const ApiError& error) {
    os << "ApiError { request_id: " << quoted(error.request_id)
       << ", error_code: ";
    writeOptional(os, error.error_code);
    return os << ", message: " << quoted(error.message) << " }";
}

} // namespace sdk
