#pragma once

#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "transport/byte_stream.hpp"

namespace genibus {

// Pulls exactly one checksummed telegram off a stream. Keeps no state between
// calls; one deadline covers the whole telegram.
//
// Failures: TIMEOUT when no start delimiter arrived, INVALID_DELIMITER,
// INVALID_LENGTH, INCOMPLETE_FRAME when the stream ran dry mid telegram,
// CRC_MISMATCH, or the stream's own connection error.
class FrameReceiver
{
public:
    enum class Stage
    {
        AWAIT_DELIMITER,
        AWAIT_LENGTH,
        AWAIT_BODY,
        VALIDATE,
        DONE,
        FAILED
    };

    static Result<std::vector<uint8_t>> receive(ByteStream& stream, int timeout_ms);
};

} // namespace genibus
