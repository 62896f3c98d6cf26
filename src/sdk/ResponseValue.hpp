#pragma once
#include <map>
#include <ostream>
#include <string>
#include <utility>

namespace sdk {

// A decoded response body together with the status and headers it arrived with
template <typename T>
class ResponseValue {
public:
    ResponseValue(T inner, long status, std::map<std::string, std::string> headers)
        : inner(std::move(inner)), status(status), headers(std::move(headers)) {}

    const T& getInner() const { return inner; }
    long getStatus() const { return status; }
    const std::map<std::string, std::string>& getHeaders() const { return headers; }

private:
    T inner;
    long status;
    std::map<std::string, std::string> headers;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const ResponseValue<T>& value) {
    os << "ResponseValue {\n"
       << "    inner: " << value.getInner() << ",\n"
       << "    status: " << value.getStatus() << ",\n"
       << "    headers: {";
    bool first = true;
    for (const auto& [name, header] : value.getHeaders()) {
        os << (first ? "" : ", ") << name << ": " << header;
        first = false;
    }
    return os << "},\n}";
}

} // namespace sdk
