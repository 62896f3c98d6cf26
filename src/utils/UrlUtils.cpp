#include "UrlUtils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

std::string UrlUtils::urlEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        if (isalnum(data[i]) || data[i] == '-' || data[i] == '_' || data[i] == '.' || data[i] == '~') {
            ss << data[i];
        } else {
            ss << "%" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
               << static_cast<int>(data[i]);
        }
    }
    return ss.str();
}

std::string UrlUtils::urlEncode(const std::string& value) {
    return urlEncode(reinterpret_cast<const unsigned char*>(value.data()), value.size());
}

std::string UrlUtils::buildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [name, value] : params) {
        query += query.empty() ? "?" : "&";
        query += urlEncode(name) + "=" + urlEncode(value);
    }
    return query;
}

std::string UrlUtils::joinPath(const std::string& base_url, const std::string& path) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}
