#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"

namespace genibus {

// Minimal byte stream the protocol engine talks through.
// read_exact never hands back a short buffer: fewer bytes than requested is
// TIMEOUT (nothing or not enough arrived in time) or READ_ERROR.
class ByteStream
{
public:
    virtual ~ByteStream() = default;

    virtual Result<bool> connect() = 0;
    virtual Result<bool> disconnect() = 0;
    virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;
    virtual Result<std::vector<uint8_t>> read_exact(size_t count, int timeout_ms) = 0;
    // Drops whatever arrived unasked; returns the number of bytes discarded
    // where the transport can tell, 0 otherwise.
    virtual Result<size_t> discard_input() = 0;

    virtual bool is_open() const = 0;
    virtual std::string describe() const = 0;
};

// The engine builds a fresh stream for every connect.
using StreamFactory = std::function<std::unique_ptr<ByteStream>()>;

} // namespace genibus
