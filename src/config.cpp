#include "common/config.hpp"
#include "transport/serial.hpp"
#include "transport/tcp_client.hpp"
#include <iostream>
#include <cerrno>
#include <cstdlib>

namespace genibus {

namespace {

bool parse_number(const std::string& text, long min, long max, long& out)
{
    if (text.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long value = strtol(text.c_str(), &end, 0);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

Result<Config> invalid(const std::string& msg)
{
    std::cerr << "[CONFIG] " << msg << std::endl;
    return Result<Config>::failure(Error::INVALID_CONFIG);
}

} // anonymous namespace

Result<Config> parse_args(int argc, char** argv, std::vector<std::string>* rest)
{
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) != 0) {
            if (rest) {
                rest->push_back(arg);
            }
            continue;
        }

        if (i + 1 >= argc) {
            return invalid("Missing value for " + arg);
        }
        std::string value = argv[++i];
        long number = 0;

        if (arg == "--tcp") {
            config.connection_type = ConnectionType::TCP;
            auto colon = value.rfind(':');
            if (colon != std::string::npos) {
                if (!parse_number(value.substr(colon + 1), 1, 65535, number)) {
                    return invalid("Bad TCP port in " + value);
                }
                config.tcp_port = static_cast<int>(number);
                value = value.substr(0, colon);
            }
            if (value.empty()) {
                return invalid("TCP connection needs a host");
            }
            config.host = value;
        } else if (arg == "--serial") {
            config.connection_type = ConnectionType::SERIAL;
            config.serial_port = value;
        } else if (arg == "--baud") {
            if (!parse_number(value, 1, 4000000, number)) {
                return invalid("Bad baud rate " + value);
            }
            config.baud = static_cast<int>(number);
        } else if (arg == "--device-addr") {
            if (!parse_number(value, 0, 0xFF, number)) {
                return invalid("Bad device address " + value);
            }
            config.device_addr = static_cast<uint8_t>(number);
        } else if (arg == "--source-addr") {
            if (!parse_number(value, 0, 0xFF, number)) {
                return invalid("Bad source address " + value);
            }
            config.source_addr = static_cast<uint8_t>(number);
        } else if (arg == "--interval") {
            if (!parse_number(value, 1, 86400, number)) {
                return invalid("Bad update interval " + value);
            }
            config.update_interval_sec = static_cast<int>(number);
        } else {
            return invalid("Unknown option " + arg);
        }
    }

    if (config.connection_type == ConnectionType::SERIAL && config.serial_port.empty()) {
        return invalid("Serial connection needs a port");
    }

    return Result<Config>::success(config);
}

StreamFactory make_stream_factory(const Config& config)
{
    if (config.connection_type == ConnectionType::TCP) {
        std::string host = config.host;
        int port = config.tcp_port;
        return [host, port]() -> std::unique_ptr<ByteStream> {
            return std::make_unique<TcpClient>(host, port);
        };
    }

    std::string path = config.serial_port;
    int baud = config.baud;
    return [path, baud]() -> std::unique_ptr<ByteStream> {
        return std::make_unique<SerialPort>(path, baud);
    };
}

std::string describe(const Config& config)
{
    if (config.connection_type == ConnectionType::TCP) {
        return "tcp://" + config.host + ":" + std::to_string(config.tcp_port);
    }
    return config.serial_port + "@" + std::to_string(config.baud);
}

} // namespace genibus
