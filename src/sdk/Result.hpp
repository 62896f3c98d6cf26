#pragma once
#include "Error.hpp"
#include "ResponseValue.hpp"
#include <utility>
#include <variant>

namespace sdk {

// Outcome of send(): exactly one of a decoded response or an Error
template <typename T>
class Result {
public:
    Result(ResponseValue<T> value) : state(std::move(value)) {}
    Result(Error error) : state(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<ResponseValue<T>>(state); }
    const ResponseValue<T>& value() const { return std::get<ResponseValue<T>>(state); }
    const Error& error() const { return std::get<Error>(state); }

private:
    std::variant<ResponseValue<T>, Error> state;
};

} // namespace sdk
