#pragma once

#include <iostream>
#include <string>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/byte_stream.hpp"

namespace genibus {

class SerialPort : public ByteStream
{
public:

    explicit SerialPort(std::string port, int baud = Protocol::DEFAULT_BAUD)
        : fd_(-1), port_(std::move(port)), baud_(baud), open_(false) {}
    ~SerialPort() override
    {
        disconnect();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    Result<bool> connect() override;
    Result<bool> disconnect() override;
    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<std::vector<uint8_t>> read_exact(size_t count, int timeout_ms) override;
    Result<size_t> discard_input() override;

    bool is_open() const override;
    std::string describe() const override;
    void set_8N1(termios &tty);
private:

    int fd_;
    std::string port_;
    int baud_;
    struct termios original_tty_;
    bool open_;

};

} // namespace genibus
