#pragma once
#include "ResponseValue.hpp"
#include "Types.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace sdk {

// Every way a send() can fail. Returned as a value, never thrown.
class Error {
public:
    enum class Kind {
        InvalidRequest,          // the builder was missing a required field
        CommunicationError,      // no HTTP response was received
        ErrorResponse,           // documented 4xx/5xx with an ApiError body
        InvalidResponsePayload,  // body did not decode as the documented type
        UnexpectedResponse,      // status the operation does not document
    };

    static Error invalidRequest(std::string message);
    static Error communication(std::string message);
    static Error errorResponse(ResponseValue<ApiError> response);
    static Error invalidResponsePayload(long status, std::string message);
    static Error unexpectedResponse(long status, std::string body);

    Kind getKind() const { return kind; }
    const std::string& getMessage() const { return message; }
    std::optional<long> getStatus() const;
    const std::optional<ResponseValue<ApiError>>& getResponse() const { return response; }

private:
    Error(Kind kind, std::string message, std::optional<long> status);

    Kind kind;
    std::string message;
    std::optional<long> status;
    std::optional<ResponseValue<ApiError>> response;
};

const char* toString(Error::Kind kind);

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace sdk
