#pragma once

#include <variant>
#include <utility>

namespace genibus {

enum class Error
{
    TIMEOUT,
    CRC_MISMATCH,
    INVALID_DELIMITER,
    INVALID_LENGTH,
    INCOMPLETE_FRAME,
    INVALID_RESPONSE,
    UNKNOWN_DATA_POINT,
    INVALID_REQUEST,
    PARSE_ERROR,
    DEVICE_ERROR,
    PORT_ERROR,
    READ_ERROR,
    WRITE_ERROR,
    NOT_CONNECTED,
    HANDSHAKE_FAILED,
    CANCELLED,
    OUT_OF_RANGE,
    INVALID_CONFIG
};

// Coarse classification the coordinator layer acts on.
enum class ErrorKind
{
    CONNECTION,
    PROTOCOL,
    TIMEOUT,
    VALIDATION
};

ErrorKind error_kind(Error error);
const char* error_name(Error error);

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    Error error() const
    {
        return std::get<Error>(data_);
    }

    ErrorKind kind() const
    {
        return error_kind(error());
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(error);
    }

private:
    std::variant<T, Error> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(error) {}
};

} // namespace genibus
