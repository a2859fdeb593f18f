#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "devices/cu300.hpp"
#include "fixtures/fake_link.hpp"
#include "mocks/mock_byte_stream.hpp"

using namespace genibus;
using namespace genibus::testing;
namespace Class = genibus::Protocol::Class;

namespace {

class Cu300Test : public ::testing::Test
{
protected:
    std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>();
    std::unique_ptr<Cu300> pump;

    void SetUp() override
    {
        link->set_value(Class::MEASURED_DATA, 37, 120);   // h
        link->set_value(Class::MEASURED_DATA, 39, 45);    // q
        link->set_value(Class::MEASURED_DATA, 35, 200);   // speed
        link->set_value(Class::MEASURED_DATA, 34, 77);    // p
        link->set_value(Class::MEASURED_DATA, 81, 1);     // act_mode1
        link->set_value(Class::MEASURED_DATA, 148, 2);    // unit_family
        link->set_value(Class::MEASURED_DATA, 149, 7);    // unit_type

        pump = std::make_unique<Cu300>(fake_factory(link), Catalog::builtin());
        pump->set_reconnect_backoff(std::chrono::milliseconds(1));
    }

    void connect()
    {
        auto result = pump->connect();
        ASSERT_TRUE(result.ok()) << error_name(result.error());
        ASSERT_EQ(pump->state(), ConnectionState::CONNECTED);
    }

    int write_count()
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        return link->write_count;
    }

    std::vector<uint8_t> last_write()
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        return link->writes.back();
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(Cu300Test, StartsDisconnected)
{
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
}

TEST_F(Cu300Test, ConnectPerformsHandshake)
{
    connect();

    ASSERT_EQ(link->writes.size(), 1u);
    EXPECT_EQ(link->writes[0][2], Protocol::CONNECTION_REQ_ADDR)
        << "Handshake goes to the connection request address";
    EXPECT_EQ(link->writes[0][3], Protocol::DEFAULT_SOURCE_ADDR);

    auto info = pump->unit_info();
    EXPECT_DOUBLE_EQ(info.at("unit_family"), 2);
    EXPECT_DOUBLE_EQ(info.at("unit_type"), 7);
}

TEST_F(Cu300Test, ConnectIsIdempotent)
{
    connect();
    connect();
    EXPECT_EQ(link->streams_created, 1);
}

TEST_F(Cu300Test, OpenFailureIsConnectionError)
{
    link->fail_connect = true;

    auto result = pump->connect();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.kind(), ErrorKind::CONNECTION);
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
}

TEST_F(Cu300Test, SilentDeviceTimesOutHandshake)
{
    link->drop_replies = 1;

    auto result = pump->connect();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::TIMEOUT) << "A silent device is reported as such";
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(link->events.back(), "disconnect");
}

TEST_F(Cu300Test, GarbledHandshakeReplyFailsHandshake)
{
    auto reply = make_telegram(0x24, {0x01, 0x20, 0x02, 0x00});
    reply.back() ^= 0xFF;
    link->scripted.push_back(reply);

    auto result = pump->connect();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::HANDSHAKE_FAILED);
    EXPECT_EQ(result.kind(), ErrorKind::CONNECTION);
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
}

TEST_F(Cu300Test, DisconnectReleasesStream)
{
    connect();
    EXPECT_TRUE(pump->disconnect().ok());
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(link->events.back(), "disconnect");
}

// ═══════════════════════════════════════════════════════════════════════════
// Polling
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(Cu300Test, PollReturnsDisplayNames)
{
    connect();

    auto data = pump->poll_data();
    ASSERT_TRUE(data.ok()) << error_name(data.error());

    const auto& values = data.value();
    EXPECT_DOUBLE_EQ(values.at("head"), 120);
    EXPECT_DOUBLE_EQ(values.at("flow"), 45);
    EXPECT_DOUBLE_EQ(values.at("speed"), 200);
    EXPECT_DOUBLE_EQ(values.at("power"), 77);
    EXPECT_DOUBLE_EQ(values.at("act_mode1"), 1);
    EXPECT_DOUBLE_EQ(values.at("alarm_code"), 0);
    EXPECT_EQ(values.count("h"), 0u) << "Raw names are not reported";
}

TEST_F(Cu300Test, PollWhileDisconnectedTouchesNothing)
{
    auto data = pump->poll_data();
    ASSERT_FALSE(data.ok());
    EXPECT_EQ(data.error(), Error::NOT_CONNECTED);
    EXPECT_EQ(link->streams_created, 0);
}

TEST_F(Cu300Test, ReadValuesReturnsStrings)
{
    link->strings[8] = "MAGNA3 25-80";
    connect();

    ValueRequest request;
    request.strings = {"product_name"};
    auto reply = pump->read_values(request);
    ASSERT_TRUE(reply.ok());
    EXPECT_EQ(reply.value().strings.at("product_name"), "MAGNA3 25-80");
}

TEST_F(Cu300Test, TimeoutKeepsConnectedState)
{
    connect();
    link->drop_replies = 1;

    auto data = pump->poll_data();
    ASSERT_FALSE(data.ok());
    EXPECT_EQ(data.error(), Error::TIMEOUT);
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED)
        << "A timeout alone must not change the connection state";

    EXPECT_TRUE(pump->poll_data().ok()) << "The next exchange works again";
}

TEST_F(Cu300Test, ReadErrorMovesToReconnecting)
{
    connect();
    link->fail_reads = true;

    auto data = pump->poll_data();
    ASSERT_FALSE(data.ok());
    EXPECT_EQ(data.error(), Error::READ_ERROR);
    EXPECT_EQ(pump->state(), ConnectionState::RECONNECTING);
}

TEST_F(Cu300Test, WriteFailureThenReconnectUsesFreshStream)
{
    link->fail_write_at = 3;    // handshake, one poll, then the failing one
    connect();
    ASSERT_TRUE(pump->poll_data().ok());

    auto data = pump->poll_data();
    ASSERT_FALSE(data.ok());
    EXPECT_EQ(data.error(), Error::WRITE_ERROR);
    EXPECT_EQ(pump->state(), ConnectionState::RECONNECTING);

    auto result = pump->reconnect();
    ASSERT_TRUE(result.ok()) << error_name(result.error());
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED);
    EXPECT_EQ(link->streams_created, 2) << "A failed stream is never reused";
    EXPECT_TRUE(pump->poll_data().ok());
}

TEST_F(Cu300Test, ConcurrentPollsAreSerialized)
{
    connect();
    link->read_delay = std::chrono::milliseconds(5);
    link->events.clear();

    auto first = std::async(std::launch::async, [this] { return pump->poll_data(); });
    auto second = std::async(std::launch::async, [this] { return pump->poll_data(); });
    EXPECT_TRUE(first.get().ok());
    EXPECT_TRUE(second.get().ok());

    std::vector<std::string> trail;
    for (const auto& event : link->events) {
        if (event == "write" || event == "read_done") {
            trail.push_back(event);
        }
    }
    const std::vector<std::string> expected = {"write", "read_done", "write", "read_done"};
    EXPECT_EQ(trail, expected) << "Second write went out before the first reply was read";
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(Cu300Test, StartPumpSendsRemoteAndStart)
{
    connect();

    ASSERT_TRUE(pump->start_pump().ok());
    auto frame = last_write();
    ASSERT_EQ(frame.size(), 10u);
    EXPECT_EQ(frame[4], Class::COMMANDS);
    EXPECT_EQ(frame[6], 7);
    EXPECT_EQ(frame[7], 6);
}

TEST_F(Cu300Test, StopPumpSendsStop)
{
    connect();

    ASSERT_TRUE(pump->stop_pump().ok());
    auto frame = last_write();
    EXPECT_EQ(frame[4], Class::COMMANDS);
    EXPECT_EQ(frame[6], 5);
}

TEST_F(Cu300Test, RejectedCommandIsDeviceError)
{
    connect();
    link->set_ack = Protocol::Ack::ILLEGAL_OPERATION;

    auto result = pump->start_pump();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::DEVICE_ERROR);
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED);
}

TEST_F(Cu300Test, LeftoverReplyIsNotTakenAsAcknowledge)
{
    connect();

    // noise before a complete poll reply: the poll fails on the first byte
    // and the reply itself is still waiting in the stream
    std::vector<uint8_t> noisy = {0x00};
    auto poll_reply = make_telegram(0x24, {0x04, 0x20, 0x02, 0x06, 120, 45, 200, 77, 1, 0});
    noisy.insert(noisy.end(), poll_reply.begin(), poll_reply.end());
    link->scripted.push_back(noisy);

    auto polled = pump->poll_data();
    ASSERT_FALSE(polled.ok());
    EXPECT_EQ(polled.error(), Error::INVALID_DELIMITER);
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED);

    link->auto_reply = false;
    auto stopped = pump->stop_pump();
    ASSERT_FALSE(stopped.ok()) << "STOP must not be acknowledged by the old poll reply";
    EXPECT_EQ(stopped.error(), Error::TIMEOUT);
}

TEST_F(Cu300Test, ReplyOfWrongClassRejectsCommand)
{
    connect();
    link->scripted.push_back(make_telegram(0x24, {0x04, 0x20, 0x02, 0x00}));

    auto result = pump->stop_pump();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::INVALID_RESPONSE);
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED);
}

TEST_F(Cu300Test, SetRemoteSendsRemoteOnly)
{
    connect();

    ASSERT_TRUE(pump->set_remote().ok());
    auto frame = last_write();
    ASSERT_EQ(frame.size(), 9u);
    EXPECT_EQ(frame[4], Class::COMMANDS);
    EXPECT_EQ(frame[5], 0x81);
    EXPECT_EQ(frame[6], 7);
}

TEST_F(Cu300Test, SetReferenceWritesRawPercent)
{
    connect();

    ASSERT_TRUE(pump->set_reference(50).ok());
    auto frame = last_write();
    EXPECT_EQ(frame[4], Class::REFERENCE_VALUES);
    EXPECT_EQ(frame[6], 1);
    EXPECT_EQ(frame[7], 50);
}

TEST_F(Cu300Test, ReferenceBoundsAreAccepted)
{
    connect();
    EXPECT_TRUE(pump->set_reference(0).ok());
    EXPECT_TRUE(pump->set_reference(100).ok());
}

TEST_F(Cu300Test, OutOfRangeReferenceNeverReachesTheWire)
{
    connect();
    int before = write_count();

    for (int value : {-1, 101, 255}) {
        auto result = pump->set_reference(value);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error(), Error::OUT_OF_RANGE);
        EXPECT_EQ(result.kind(), ErrorKind::VALIDATION);
    }
    EXPECT_EQ(write_count(), before);
}

TEST_F(Cu300Test, OutOfRangeReferenceWithoutConnection)
{
    Cu300 offline([]() -> std::unique_ptr<ByteStream> {
        ADD_FAILURE() << "Validation must happen before any stream is created";
        return nullptr;
    }, Catalog::builtin());

    auto result = offline.set_reference(101);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::OUT_OF_RANGE);
}

TEST_F(Cu300Test, CommandsWhileDisconnectedFailFast)
{
    EXPECT_EQ(pump->start_pump().error(), Error::NOT_CONNECTED);
    EXPECT_EQ(pump->stop_pump().error(), Error::NOT_CONNECTED);
    EXPECT_EQ(pump->set_reference(10).error(), Error::NOT_CONNECTED);
    EXPECT_EQ(write_count(), 0);
}

TEST_F(Cu300Test, SetParametersRejectsEmptyList)
{
    connect();
    EXPECT_EQ(pump->set_parameters({}).error(), Error::OUT_OF_RANGE);
}

TEST_F(Cu300Test, SetParametersWritesConfigurationBlock)
{
    connect();

    ASSERT_TRUE(pump->set_parameters({{"group_addr", 0x81}}).ok());
    auto frame = last_write();
    EXPECT_EQ(frame[4], Class::CONFIGURATION_PARAMETERS);
    EXPECT_EQ(frame[6], 47);
    EXPECT_EQ(frame[7], 0x81);
}

TEST_F(Cu300Test, UnknownDataPointLeavesConnectionUp)
{
    connect();

    ValueRequest request;
    request.measurements = {"not_a_point"};
    auto reply = pump->read_values(request);
    ASSERT_FALSE(reply.ok());
    EXPECT_EQ(reply.error(), Error::UNKNOWN_DATA_POINT);
    EXPECT_EQ(pump->state(), ConnectionState::CONNECTED);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reconnect and cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(Cu300Test, CancelAbortsReconnectBackoff)
{
    connect();
    pump->set_reconnect_backoff(std::chrono::seconds(30));

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [this] { return pump->reconnect(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pump->cancel();

    auto result = pending.get();
    auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::CANCELLED);
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(link->streams_created, 1) << "No new stream after cancellation";
}

TEST_F(Cu300Test, CancelledEngineRefusesToConnect)
{
    pump->cancel();
    EXPECT_EQ(pump->connect().error(), Error::CANCELLED);

    pump->clear_cancel();
    connect();
}

TEST_F(Cu300Test, ReconnectFailureIsReported)
{
    connect();
    link->fail_connect = true;

    auto result = pump->reconnect();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.kind(), ErrorKind::CONNECTION);
    EXPECT_EQ(pump->state(), ConnectionState::DISCONNECTED);
}

TEST_F(Cu300Test, LogCallbackSeesTraffic)
{
    std::vector<std::string> lines;
    pump->set_log_callback([&lines](const std::string& msg) { lines.push_back(msg); });
    connect();

    bool saw_tx = false;
    for (const auto& line : lines) {
        if (line.rfind("[GENIBUS] TX: 270E", 0) == 0) {
            saw_tx = true;
        }
    }
    EXPECT_TRUE(saw_tx) << "Handshake telegram should be logged as hex";
}
