#pragma once

#include "transport/byte_stream.hpp"
#include "transport/genibus.hpp"
#include "common/types.hpp"
#include "common/protocol.hpp"
#include "common/catalog.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <stdint.h>

namespace genibus {

enum class ConnectionState
{
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING
};

const char* state_name(ConnectionState state);

// GENIBus master for a CU300 (or any MAGNA family unit).
//
// Every exchange holds mutex_ from building the request until the reply is
// decoded: the bus has no request ids, so replies can only be matched by order.
// A TIMEOUT leaves the state alone; a stream failure drops the stream and
// moves to RECONNECTING. Recovery is up to the caller.
class Cu300
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    Cu300(StreamFactory factory, std::shared_ptr<const Catalog> catalog,
          uint8_t device_addr = Protocol::DEFAULT_DEVICE_ADDR,
          uint8_t source_addr = Protocol::DEFAULT_SOURCE_ADDR);
    ~Cu300();

    Cu300(const Cu300&) = delete;
    Cu300& operator=(const Cu300&) = delete;

    Result<bool> connect();
    Result<bool> disconnect();
    Result<bool> reconnect();

    // Aborts a pending reconnect backoff and refuses further connects.
    void cancel();
    void clear_cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    Result<Values> poll_data();
    Result<ReplyData> read_values(const ValueRequest& request, int timeout_ms = Protocol::POLL_TIMEOUT_MS);

    Result<bool> start_pump();
    Result<bool> stop_pump();
    Result<bool> set_remote();
    Result<bool> set_reference(int value);
    Result<bool> set_parameters(const std::vector<Assignment>& parameters);

    ConnectionState state() const { return state_.load(); }
    Values unit_info() const;

    void set_reconnect_backoff(std::chrono::milliseconds backoff) { backoff_ = backoff; }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

    // Data points requested by poll_data() and the names they are reported under
    static ValueRequest poll_request();
    static const std::vector<std::pair<std::string, std::string>>& poll_names();

private:
    StreamFactory factory_;
    std::shared_ptr<const Catalog> catalog_;
    GenibusFrame codec_;
    uint8_t device_addr_;
    uint8_t source_addr_;

    std::unique_ptr<ByteStream> stream_;
    mutable std::mutex mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    Values unit_info_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    std::chrono::milliseconds backoff_{Protocol::RECONNECT_BACKOFF_MS};

    LogCallback log_callback_;

    void log(const std::string& msg);
    Header request_header() const;

    // The following expect mutex_ to be held
    Result<bool> connect_locked();
    void disconnect_locked();
    void drop_stream(Error cause);
    Result<std::vector<uint8_t>> exchange(std::vector<uint8_t> frame, int timeout_ms);

    using FrameBuilder = std::function<Result<std::vector<uint8_t>>()>;
    Result<bool> send_command(const FrameBuilder& build, const std::string& what);
};

} // namespace genibus
