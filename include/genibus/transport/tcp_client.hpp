#pragma once

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/byte_stream.hpp"
#include <string>
#include <cstdint>
#include <vector>

namespace genibus {

// GENIBus over a raw TCP socket (RS-485 gateway or CIU module)
class TcpClient : public ByteStream
{
public:
    explicit TcpClient(std::string host, int port = Protocol::DEFAULT_TCP_PORT,
                       int connect_timeout_ms = Protocol::CONNECT_TIMEOUT_MS);
    ~TcpClient() override;

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    Result<bool> connect() override;
    Result<bool> disconnect() override;
    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<std::vector<uint8_t>> read_exact(size_t count, int timeout_ms) override;
    Result<size_t> discard_input() override;

    bool is_open() const override { return socket_fd_ >= 0; }
    std::string describe() const override;

private:
    std::string host_;
    int port_;
    int connect_timeout_ms_;
    int socket_fd_{-1};
    std::string last_error_;
};

} // namespace genibus
