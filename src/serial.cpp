#include "transport/serial.hpp"
#include <poll.h>
#include <chrono>
#include <algorithm>

namespace genibus {

namespace {

speed_t to_speed(int baud)
{
    switch (baud) {
    case 1200:   return B1200;
    case 2400:   return B2400;
    case 4800:   return B4800;
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    default:     return 0;
    }
}

} // anonymous namespace

Result<bool> SerialPort::connect()
{
    if (open_) {
        return Result<bool>::success(true);
    }

    speed_t speed = to_speed(baud_);
    if (speed == 0)
    {
        std::cerr << "Unsupported baud rate " << baud_ << " for " << port_ << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY);
    if(fd_ < 0)
    {
        std::cerr << "Error opening " << port_ << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if(tcgetattr(fd_, &original_tty_) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct termios tty = original_tty_;

    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    cfmakeraw(&tty);
    set_8N1(tty);

    // reads are driven by poll() with our own deadline
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if(tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        std::cerr << "Error setting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    tcflush(fd_, TCIOFLUSH);
    open_ = true;
    return Result<bool>::success(true);
}

Result<bool> SerialPort::disconnect()
{
    if(fd_ >= 0)
    {
        tcsetattr(fd_, TCSANOW, &original_tty_);
        int rc = ::close(fd_);
        fd_ = -1;
        open_ = false;
        if (rc != 0) {
            return Result<bool>::failure(Error::PORT_ERROR);
        }
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<size_t> SerialPort::write(const uint8_t* data, size_t len)
{
    if(fd_ < 0)
        return Result<size_t>::failure(Error::NOT_CONNECTED);

    size_t total = 0;
    while (total < len)
    {
        ssize_t written = ::write(fd_, data + total, len - total);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return Result<size_t>::failure(Error::WRITE_ERROR);
        }
        total += static_cast<size_t>(written);
    }

    if (tcdrain(fd_) != 0)
        return Result<size_t>::failure(Error::WRITE_ERROR);

    return Result<size_t>::success(total);
}

Result<std::vector<uint8_t>> SerialPort::read_exact(size_t count, int timeout_ms)
{
    if (fd_ < 0)
        return Result<std::vector<uint8_t>>::failure(Error::NOT_CONNECTED);

    std::vector<uint8_t> buffer;
    buffer.reserve(count);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (buffer.size() < count)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0)
            return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT);

        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(remaining));

        if (ret < 0)
        {
            if (errno == EINTR)
                continue;
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }
        if (ret == 0)
            return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT);

        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);

        uint8_t temp[256];
        size_t want = std::min(sizeof(temp), count - buffer.size());
        ssize_t n = ::read(fd_, temp, want);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }
        buffer.insert(buffer.end(), temp, temp + n);
    }

    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

bool SerialPort::is_open() const
{
    return open_;
}

std::string SerialPort::describe() const
{
    return port_ + "@" + std::to_string(baud_);
}

Result<size_t> SerialPort::discard_input()
{
    if (fd_ < 0)
        return Result<size_t>::failure(Error::NOT_CONNECTED);

    if (tcflush(fd_, TCIFLUSH) != 0)
    {
        std::cerr << "Error flushing " << port_ << ": " << strerror(errno) << "\n";
        return Result<size_t>::failure(Error::READ_ERROR);
    }
    return Result<size_t>::success(0);
}

void SerialPort::set_8N1(termios &tty)
{
    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag |= CREAD | CLOCAL;
}

} // namespace genibus
