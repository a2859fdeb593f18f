#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "common/config.hpp"

using namespace genibus;

namespace {

// argv as main() would see it
class Args
{
public:
    Args() : Args(std::initializer_list<std::string>{}) {}

    Args(std::initializer_list<std::string> args) : storage_(args)
    {
        storage_.insert(storage_.begin(), "genibus_cli");
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        argv_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, Defaults)
{
    Config config;
    EXPECT_EQ(config.connection_type, ConnectionType::SERIAL);
    EXPECT_EQ(config.serial_port, "/dev/ttyUSB0");
    EXPECT_EQ(config.baud, 9600);
    EXPECT_EQ(config.tcp_port, 502);
    EXPECT_EQ(config.device_addr, 0x20);
    EXPECT_EQ(config.source_addr, 0x04);
    EXPECT_EQ(config.update_interval_sec, 30);
}

TEST(ConfigTest, NoArgumentsGiveDefaults)
{
    Args args;
    auto config = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().connection_type, ConnectionType::SERIAL);
}

// ═══════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, TcpHostWithPort)
{
    Args args({"--tcp", "192.168.1.50:8502"});
    auto config = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().connection_type, ConnectionType::TCP);
    EXPECT_EQ(config.value().host, "192.168.1.50");
    EXPECT_EQ(config.value().tcp_port, 8502);
}

TEST(ConfigTest, TcpHostUsesDefaultPort)
{
    Args args({"--tcp", "cu300.local"});
    auto config = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().host, "cu300.local");
    EXPECT_EQ(config.value().tcp_port, 502);
}

TEST(ConfigTest, SerialOptions)
{
    Args args({"--serial", "/dev/ttyS1", "--baud", "19200", "--interval", "5"});
    auto config = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().serial_port, "/dev/ttyS1");
    EXPECT_EQ(config.value().baud, 19200);
    EXPECT_EQ(config.value().update_interval_sec, 5);
}

TEST(ConfigTest, AddressesAcceptHex)
{
    Args args({"--device-addr", "0x21", "--source-addr", "2"});
    auto config = parse_args(args.argc(), args.argv());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().device_addr, 0x21);
    EXPECT_EQ(config.value().source_addr, 0x02);
}

TEST(ConfigTest, PositionalArgumentsAreCollected)
{
    Args args({"--tcp", "host", "ref", "40"});
    std::vector<std::string> rest;
    auto config = parse_args(args.argc(), args.argv(), &rest);
    ASSERT_TRUE(config.ok());
    const std::vector<std::string> expected = {"ref", "40"};
    EXPECT_EQ(rest, expected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejected input
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, RejectsBadInput)
{
    const std::vector<std::vector<std::string>> cases = {
        {"--baud", "fast"},
        {"--baud"},
        {"--device-addr", "256"},
        {"--tcp", ":502"},
        {"--tcp", "host:0"},
        {"--interval", "0"},
        {"--serial", ""},
        {"--colour", "blue"},
    };

    for (const auto& input : cases) {
        std::vector<std::string> storage = {"genibus_cli"};
        storage.insert(storage.end(), input.begin(), input.end());
        std::vector<char*> argv;
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto config = parse_args(static_cast<int>(storage.size()), argv.data());
        ASSERT_FALSE(config.ok()) << "Accepted " << input[0];
        EXPECT_EQ(config.error(), Error::INVALID_CONFIG);
        EXPECT_EQ(config.kind(), ErrorKind::VALIDATION);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Stream factory
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, FactoryBuildsConfiguredTransport)
{
    Config tcp;
    tcp.connection_type = ConnectionType::TCP;
    tcp.host = "10.0.0.7";
    auto tcp_stream = make_stream_factory(tcp)();
    ASSERT_NE(tcp_stream, nullptr);
    EXPECT_EQ(tcp_stream->describe(), "10.0.0.7:502");
    EXPECT_FALSE(tcp_stream->is_open());

    Config serial;
    auto serial_stream = make_stream_factory(serial)();
    ASSERT_NE(serial_stream, nullptr);
    EXPECT_EQ(serial_stream->describe(), "/dev/ttyUSB0@9600");
}

TEST(ConfigTest, FactoryCreatesNewStreamEachCall)
{
    auto factory = make_stream_factory(Config{});
    auto a = factory();
    auto b = factory();
    EXPECT_NE(a.get(), b.get());
}
