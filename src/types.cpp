#include "common/types.hpp"

namespace genibus {

ErrorKind error_kind(Error error)
{
    switch (error) {
    case Error::TIMEOUT:
        return ErrorKind::TIMEOUT;
    case Error::PORT_ERROR:
    case Error::READ_ERROR:
    case Error::WRITE_ERROR:
    case Error::NOT_CONNECTED:
    case Error::HANDSHAKE_FAILED:
    case Error::CANCELLED:
        return ErrorKind::CONNECTION;
    case Error::OUT_OF_RANGE:
    case Error::INVALID_REQUEST:
    case Error::INVALID_CONFIG:
        return ErrorKind::VALIDATION;
    case Error::CRC_MISMATCH:
    case Error::INVALID_DELIMITER:
    case Error::INVALID_LENGTH:
    case Error::INCOMPLETE_FRAME:
    case Error::INVALID_RESPONSE:
    case Error::UNKNOWN_DATA_POINT:
    case Error::PARSE_ERROR:
    case Error::DEVICE_ERROR:
        break;
    }
    return ErrorKind::PROTOCOL;
}

const char* error_name(Error error)
{
    switch (error) {
    case Error::TIMEOUT:            return "timeout";
    case Error::CRC_MISMATCH:       return "checksum mismatch";
    case Error::INVALID_DELIMITER:  return "invalid start delimiter";
    case Error::INVALID_LENGTH:     return "invalid frame length";
    case Error::INCOMPLETE_FRAME:   return "incomplete frame";
    case Error::INVALID_RESPONSE:   return "invalid response";
    case Error::UNKNOWN_DATA_POINT: return "unknown data point";
    case Error::INVALID_REQUEST:    return "invalid request";
    case Error::PARSE_ERROR:        return "parse error";
    case Error::DEVICE_ERROR:       return "device error";
    case Error::PORT_ERROR:         return "port error";
    case Error::READ_ERROR:         return "read error";
    case Error::WRITE_ERROR:        return "write error";
    case Error::NOT_CONNECTED:      return "not connected";
    case Error::HANDSHAKE_FAILED:   return "handshake failed";
    case Error::CANCELLED:          return "cancelled";
    case Error::OUT_OF_RANGE:       return "value out of range";
    case Error::INVALID_CONFIG:     return "invalid configuration";
    }
    return "unknown error";
}

} // namespace genibus
