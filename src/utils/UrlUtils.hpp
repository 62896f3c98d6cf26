#pragma once
#include <string>
#include <utility>
#include <vector>

class UrlUtils {
public:
    static std::string urlEncode(const unsigned char* data, size_t len);
    static std::string urlEncode(const std::string& value);

    // Returns "" for no parameters, otherwise "?a=1&b=2" with every name and value encoded
    static std::string buildQuery(const std::vector<std::pair<std::string, std::string>>& params);

    // Joins a base URL and an absolute path without doubling the slash
    static std::string joinPath(const std::string& base_url, const std::string& path);
};
