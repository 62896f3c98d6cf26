#include "Error.hpp"
#include <utility>

namespace sdk {

Error::Error(Kind kind, std::string message, std::optional<long> status)
    : kind(kind), message(std::move(message)), status(status) {}

Error Error::invalidRequest(std::string message) {
    return Error(Kind::InvalidRequest, std::move(message), std::nullopt);
}

Error Error::communication(std::string message) {
    return Error(Kind::CommunicationError, std::move(message), std::nullopt);
}

Error Error::errorResponse(ResponseValue<ApiError> response) {
    Error error(Kind::ErrorResponse, response.getInner().message, response.getStatus());
    error.response = std::move(response);
    return error;
}

Error Error::invalidResponsePayload(long status, std::string message) {
    return Error(Kind::InvalidResponsePayload, std::move(message), status);
}

Error Error::unexpectedResponse(long status, std::string body) {
    return Error(Kind::UnexpectedResponse, std::move(body), status);
}

std::optional<long> Error::getStatus() const {
    return status;
}

const char* toString(Error::Kind kind) {
    switch (kind) {
    case Error::Kind::InvalidRequest:
        return "InvalidRequest";
    case Error::Kind::CommunicationError:
        return "CommunicationError";
    case Error::Kind::ErrorResponse:
        return "ErrorResponse";
    case Error::Kind::InvalidResponsePayload:
        return "InvalidResponsePayload";
    case Error::Kind::UnexpectedResponse:
        return "UnexpectedResponse";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << "Error::" << toString(error.getKind()) << "(";
    if (error.getResponse()) {
        os << *error.getResponse();
    } else {
        if (error.getStatus()) {
            os << "status " << *error.getStatus() << ": ";
        }
        os << quoted(error.getMessage());
    }
    return os << ")";
}

} // namespace sdk
