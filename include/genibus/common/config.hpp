#pragma once

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/byte_stream.hpp"
#include <string>
#include <vector>
#include <stdint.h>

namespace genibus {

enum class ConnectionType
{
    SERIAL,
    TCP
};

struct Config
{
    ConnectionType connection_type = ConnectionType::SERIAL;

    std::string host;
    int tcp_port = Protocol::DEFAULT_TCP_PORT;

    std::string serial_port = "/dev/ttyUSB0";
    int baud = Protocol::DEFAULT_BAUD;

    uint8_t device_addr = Protocol::DEFAULT_DEVICE_ADDR;
    uint8_t source_addr = Protocol::DEFAULT_SOURCE_ADDR;
    int update_interval_sec = Protocol::DEFAULT_UPDATE_INTERVAL_SEC;
};

// Options:
//   --tcp HOST[:PORT]     CU300 behind a TCP gateway
//   --serial PATH         RS-485 adapter (default /dev/ttyUSB0)
//   --baud N
//   --device-addr N       decimal or 0x prefixed
//   --source-addr N
//   --interval SEC
// Positional arguments are collected into rest when given; unknown options fail
Result<Config> parse_args(int argc, char** argv, std::vector<std::string>* rest = nullptr);

// Creates a fresh stream per call; the engine never reuses a stream.
StreamFactory make_stream_factory(const Config& config);

std::string describe(const Config& config);

} // namespace genibus
