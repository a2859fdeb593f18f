#include "transport/tcp_client.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <iostream>

namespace genibus {

namespace {

// Set socket to non-blocking mode
bool set_nonblocking(int fd, bool nonblocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (nonblocking) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return fcntl(fd, F_SETFL, flags) >= 0;
}

// Non-blocking connect bounded by timeout_ms, socket left blocking afterwards
Result<bool> connect_with_timeout(int fd, const struct sockaddr* addr, socklen_t addr_len,
                                  int timeout_ms, std::string& last_error)
{
    if (!set_nonblocking(fd, true)) {
        last_error = "fcntl failed";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if (::connect(fd, addr, addr_len) < 0) {
        if (errno != EINPROGRESS) {
            last_error = std::string("connect: ") + strerror(errno);
            return Result<bool>::failure(Error::PORT_ERROR);
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret == 0) {
            last_error = "Connect timeout";
            return Result<bool>::failure(Error::TIMEOUT);
        }
        if (ret < 0) {
            last_error = std::string("poll: ") + strerror(errno);
            return Result<bool>::failure(Error::PORT_ERROR);
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            last_error = std::string("connect: ") + strerror(so_error);
            return Result<bool>::failure(Error::PORT_ERROR);
        }
    }

    if (!set_nonblocking(fd, false)) {
        last_error = "fcntl failed";
        return Result<bool>::failure(Error::PORT_ERROR);
    }
    return Result<bool>::success(true);
}

} // anonymous namespace

TcpClient::TcpClient(std::string host, int port, int connect_timeout_ms)
    : host_(std::move(host)), port_(port), connect_timeout_ms_(connect_timeout_ms) {}

TcpClient::~TcpClient()
{
    disconnect();
}

Result<bool> TcpClient::connect()
{
    if (socket_fd_ >= 0) {
        return Result<bool>::success(true);
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port_);
    int gai = getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        last_error_ = std::string("Invalid address: ") + gai_strerror(gai);
        std::cerr << "[TCP] " << describe() << ": " << last_error_ << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    Result<bool> outcome = Result<bool>::failure(Error::PORT_ERROR);
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error_ = "Failed to create socket";
            continue;
        }

        outcome = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, connect_timeout_ms_, last_error_);
        if (outcome.ok()) {
            int one = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            socket_fd_ = fd;
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(res);

    if (!outcome.ok()) {
        std::cerr << "[TCP] Failed to connect to " << describe() << ": " << last_error_ << "\n";
    }
    return outcome;
}

Result<bool> TcpClient::disconnect()
{
    if (socket_fd_ >= 0) {
        int rc = ::close(socket_fd_);
        socket_fd_ = -1;
        if (rc != 0) {
            last_error_ = std::string("close: ") + strerror(errno);
            return Result<bool>::failure(Error::PORT_ERROR);
        }
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<size_t> TcpClient::write(const uint8_t* data, size_t len)
{
    if (socket_fd_ < 0) {
        last_error_ = "Not connected";
        return Result<size_t>::failure(Error::NOT_CONNECTED);
    }

    size_t total = 0;
    while (total < len) {
        ssize_t sent = ::send(socket_fd_, data + total, len - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            last_error_ = std::string("Send failed: ") + strerror(errno);
            return Result<size_t>::failure(Error::WRITE_ERROR);
        }
        total += static_cast<size_t>(sent);
    }

    return Result<size_t>::success(total);
}

Result<std::vector<uint8_t>> TcpClient::read_exact(size_t count, int timeout_ms)
{
    if (socket_fd_ < 0) {
        last_error_ = "Not connected";
        return Result<std::vector<uint8_t>>::failure(Error::NOT_CONNECTED);
    }

    std::vector<uint8_t> buffer(count);
    size_t received = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (received < count) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            last_error_ = "Timeout";
            return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT);
        }

        struct pollfd pfd;
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret == 0) {
            last_error_ = "Timeout";
            return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT);
        }
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            last_error_ = "Poll error";
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }

        ssize_t n = ::recv(socket_fd_, buffer.data() + received, count - received, 0);
        if (n == 0) {
            last_error_ = "Connection closed by peer";
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            last_error_ = std::string("Receive error: ") + strerror(errno);
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
        }
        received += static_cast<size_t>(n);
    }

    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

Result<size_t> TcpClient::discard_input()
{
    if (socket_fd_ < 0) {
        last_error_ = "Not connected";
        return Result<size_t>::failure(Error::NOT_CONNECTED);
    }

    uint8_t temp[256];
    size_t discarded = 0;
    while (true) {
        ssize_t n = ::recv(socket_fd_, temp, sizeof(temp), MSG_DONTWAIT);
        if (n > 0) {
            discarded += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            last_error_ = "Connection closed by peer";
            std::cerr << "[TCP] " << describe() << ": " << last_error_ << "\n";
            return Result<size_t>::failure(Error::READ_ERROR);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        last_error_ = std::string("Receive error: ") + strerror(errno);
        std::cerr << "[TCP] " << describe() << ": " << last_error_ << "\n";
        return Result<size_t>::failure(Error::READ_ERROR);
    }

    return Result<size_t>::success(discarded);
}

std::string TcpClient::describe() const
{
    return host_ + ":" + std::to_string(port_);
}

} // namespace genibus
