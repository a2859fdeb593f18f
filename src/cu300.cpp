#include "devices/cu300.hpp"
#include "transport/frame_receiver.hpp"
#include "common/crc16.hpp"
#include "common/helpers.hpp"

namespace genibus {

namespace {

// Whatever goes wrong while connecting is reported as a connection failure,
// except a silent peer, which stays a timeout
Error as_connection_error(Error error, Error fallback)
{
    switch (error_kind(error)) {
    case ErrorKind::CONNECTION:
    case ErrorKind::TIMEOUT:
        return error;
    default:
        return fallback;
    }
}

} // anonymous namespace

const char* state_name(ConnectionState state)
{
    switch (state) {
    case ConnectionState::DISCONNECTED: return "disconnected";
    case ConnectionState::CONNECTING:   return "connecting";
    case ConnectionState::CONNECTED:    return "connected";
    case ConnectionState::RECONNECTING: return "reconnecting";
    }
    return "unknown";
}

Cu300::Cu300(StreamFactory factory, std::shared_ptr<const Catalog> catalog,
             uint8_t device_addr, uint8_t source_addr)
    : factory_(std::move(factory)),
      catalog_(catalog),
      codec_(catalog),
      device_addr_(device_addr),
      source_addr_(source_addr)
{
}

Cu300::~Cu300()
{
    cancel();
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

void Cu300::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Header Cu300::request_header() const
{
    Header header;
    header.start_delimiter = Protocol::FrameType::DATA_REQUEST;
    header.dest_addr = device_addr_;
    header.source_addr = source_addr_;
    return header;
}

ValueRequest Cu300::poll_request()
{
    ValueRequest request;
    request.measurement_class = Protocol::Class::MEASURED_DATA;
    for (const auto& name : poll_names()) {
        request.measurements.push_back(name.first);
    }
    return request;
}

const std::vector<std::pair<std::string, std::string>>& Cu300::poll_names()
{
    static const std::vector<std::pair<std::string, std::string>> names = {
        {"h", "head"},
        {"q", "flow"},
        {"speed", "speed"},
        {"p", "power"},
        {"act_mode1", "act_mode1"},
        {"alarm_code", "alarm_code"},
    };
    return names;
}

Values Cu300::unit_info() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return unit_info_;
}

void Cu300::cancel()
{
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_.store(true);
    }
    cancel_cv_.notify_all();
}

void Cu300::clear_cancel()
{
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    cancelled_.store(false);
}

Result<bool> Cu300::connect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_locked();
}

Result<bool> Cu300::connect_locked()
{
    if (cancelled_.load()) {
        disconnect_locked();
        return Result<bool>::failure(Error::CANCELLED);
    }

    if (state_.load() == ConnectionState::CONNECTED && stream_) {
        return Result<bool>::success(true);
    }

    if (state_.load() != ConnectionState::RECONNECTING) {
        state_.store(ConnectionState::CONNECTING);
    }

    // a stream is never reused, every connect gets a fresh one
    if (stream_) {
        auto closed = stream_->disconnect();
        if (!closed.ok()) {
            log(std::string("[GENIBUS] Error closing stale stream: ") + error_name(closed.error()));
        }
        stream_.reset();
    }

    stream_ = factory_ ? factory_() : nullptr;
    if (!stream_) {
        log("[GENIBUS] No stream available");
        state_.store(ConnectionState::DISCONNECTED);
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    log("[GENIBUS] Connecting to " + stream_->describe());

    auto opened = stream_->connect();
    if (!opened.ok()) {
        log("[GENIBUS] Failed to open " + stream_->describe() + ": " + error_name(opened.error()));
        stream_.reset();
        state_.store(ConnectionState::DISCONNECTED);
        return Result<bool>::failure(as_connection_error(opened.error(), Error::PORT_ERROR));
    }

    if (cancelled_.load()) {
        log("[GENIBUS] Connect cancelled");
        disconnect_locked();
        return Result<bool>::failure(Error::CANCELLED);
    }

    auto request = codec_.build_connect_request(source_addr_);
    if (!request.ok()) {
        log(std::string("[GENIBUS] Cannot build connect request: ") + error_name(request.error()));
        disconnect_locked();
        return Result<bool>::failure(Error::HANDSHAKE_FAILED);
    }

    auto reply = exchange(request.value(), Protocol::HANDSHAKE_TIMEOUT_MS);
    if (!reply.ok()) {
        log(std::string("[GENIBUS] No valid reply to connect request: ") + error_name(reply.error()));
        disconnect_locked();
        return Result<bool>::failure(as_connection_error(reply.error(), Error::HANDSHAKE_FAILED));
    }

    auto info = codec_.parse(reply.value(), GenibusFrame::connect_request());
    if (info.ok()) {
        unit_info_ = info.value().values;
        log("[GENIBUS] Unit info: " + formatValues(unit_info_));
    } else {
        unit_info_.clear();
        log(std::string("[GENIBUS] Connect reply not decoded: ") + error_name(info.error()));
    }

    state_.store(ConnectionState::CONNECTED);
    log("[GENIBUS] Connected to " + stream_->describe());
    return Result<bool>::success(true);
}

Result<bool> Cu300::disconnect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    log("[GENIBUS] Disconnecting");
    disconnect_locked();
    return Result<bool>::success(true);
}

void Cu300::disconnect_locked()
{
    if (stream_) {
        auto closed = stream_->disconnect();
        if (!closed.ok()) {
            log(std::string("[GENIBUS] Error during disconnect: ") + error_name(closed.error()));
        }
        stream_.reset();
    }
    state_.store(ConnectionState::DISCONNECTED);
}

Result<bool> Cu300::reconnect()
{
    log("[GENIBUS] Attempting reconnection");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_locked();
        state_.store(ConnectionState::RECONNECTING);
    }

    {
        std::unique_lock<std::mutex> lock(cancel_mutex_);
        cancel_cv_.wait_for(lock, backoff_, [this] { return cancelled_.load(); });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
        log("[GENIBUS] Reconnect cancelled");
        disconnect_locked();
        return Result<bool>::failure(Error::CANCELLED);
    }
    return connect_locked();
}

void Cu300::drop_stream(Error cause)
{
    log(std::string("[GENIBUS] Stream failure: ") + error_name(cause));
    if (stream_) {
        auto closed = stream_->disconnect();
        if (!closed.ok()) {
            log(std::string("[GENIBUS] Error closing failed stream: ") + error_name(closed.error()));
        }
        stream_.reset();
    }
    state_.store(ConnectionState::RECONNECTING);
}

Result<std::vector<uint8_t>> Cu300::exchange(std::vector<uint8_t> frame, int timeout_ms)
{
    if (!stream_) {
        return Result<std::vector<uint8_t>>::failure(Error::NOT_CONNECTED);
    }

    // builders append the CRC already; only add it when it is missing
    if (!CRC16::verify(frame, true)) {
        frame = CRC16::append(std::move(frame));
    }

    // a late or partly read reply must not be taken for this one
    auto flushed = stream_->discard_input();
    if (!flushed.ok()) {
        log(std::string("[GENIBUS] Cannot clear input: ") + error_name(flushed.error()));
        if (flushed.kind() == ErrorKind::CONNECTION) {
            drop_stream(flushed.error());
        }
        return Result<std::vector<uint8_t>>::failure(flushed.error());
    }
    if (flushed.value() > 0) {
        log("[GENIBUS] Discarded " + std::to_string(flushed.value()) + " stale bytes");
    }

    log("[GENIBUS] TX: " + bytesToHex(frame));

    auto written = stream_->write(frame.data(), frame.size());
    if (!written.ok() || written.value() != frame.size()) {
        Error error = written.ok() ? Error::WRITE_ERROR : written.error();
        if (error_kind(error) == ErrorKind::CONNECTION) {
            drop_stream(error);
        }
        return Result<std::vector<uint8_t>>::failure(error);
    }

    auto reply = FrameReceiver::receive(*stream_, timeout_ms);
    if (!reply.ok()) {
        log(std::string("[GENIBUS] RX failed: ") + error_name(reply.error()));
        if (reply.kind() == ErrorKind::CONNECTION) {
            drop_stream(reply.error());
        }
        return reply;
    }

    log("[GENIBUS] RX: " + bytesToHex(reply.value()));
    return reply;
}

Result<ReplyData> Cu300::read_values(const ValueRequest& request, int timeout_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.load() != ConnectionState::CONNECTED || !stream_) {
        return Result<ReplyData>::failure(Error::NOT_CONNECTED);
    }

    auto frame = codec_.build_get_values(request_header(), request);
    if (!frame.ok()) {
        log(std::string("[GENIBUS] Cannot build request: ") + error_name(frame.error()));
        return Result<ReplyData>::failure(frame.error());
    }

    auto reply = exchange(frame.value(), timeout_ms);
    if (!reply.ok()) {
        return Result<ReplyData>::failure(reply.error());
    }

    auto parsed = codec_.parse(reply.value(), request);
    if (!parsed.ok()) {
        log(std::string("[GENIBUS] Failed to parse response: ") + error_name(parsed.error()));
    }
    return parsed;
}

Result<Values> Cu300::poll_data()
{
    auto reply = read_values(poll_request(), Protocol::POLL_TIMEOUT_MS);
    if (!reply.ok()) {
        log(std::string("[GENIBUS] Error polling data: ") + error_name(reply.error()));
        return Result<Values>::failure(reply.error());
    }

    Values data;
    const auto& values = reply.value().values;
    for (const auto& [raw, display] : poll_names()) {
        auto it = values.find(raw);
        if (it != values.end()) {
            data[display] = it->second;
        }
    }

    log("[GENIBUS] Parsed data: " + formatValues(data));
    return Result<Values>::success(std::move(data));
}

Result<bool> Cu300::send_command(const FrameBuilder& build, const std::string& what)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.load() != ConnectionState::CONNECTED || !stream_) {
        log("[GENIBUS] Cannot " + what + ": not connected");
        return Result<bool>::failure(Error::NOT_CONNECTED);
    }

    auto frame = build();
    if (!frame.ok()) {
        log("[GENIBUS] Cannot build " + what + " request: " + error_name(frame.error()));
        return Result<bool>::failure(frame.error());
    }

    auto reply = exchange(frame.value(), Protocol::COMMAND_TIMEOUT_MS);
    if (!reply.ok()) {
        log("[GENIBUS] Failed to " + what + ": " + error_name(reply.error()));
        return Result<bool>::failure(reply.error());
    }

    auto ack = codec_.check_ack(reply.value(), frame.value());
    if (!ack.ok()) {
        log("[GENIBUS] " + what + " rejected: " + error_name(ack.error()));
        return ack;
    }

    log("[GENIBUS] " + what + " acknowledged");
    return Result<bool>::success(true);
}

Result<bool> Cu300::start_pump()
{
    return send_command([this]() {
        return codec_.build_set_commands(request_header(), {"REMOTE", "START"});
    }, "start pump");
}

Result<bool> Cu300::stop_pump()
{
    return send_command([this]() {
        return codec_.build_set_commands(request_header(), {"STOP"});
    }, "stop pump");
}

Result<bool> Cu300::set_remote()
{
    return send_command([this]() {
        return codec_.build_set_remote(request_header());
    }, "set remote");
}

Result<bool> Cu300::set_reference(int value)
{
    if (value < Protocol::REFERENCE_MIN || value > Protocol::REFERENCE_MAX) {
        log("[GENIBUS] Reference " + std::to_string(value) + " outside 0..100");
        return Result<bool>::failure(Error::OUT_OF_RANGE);
    }

    return send_command([this, value]() {
        ValueAssignment values;
        values.references.emplace_back("ref", static_cast<uint8_t>(value));
        return codec_.build_set_values(request_header(), values);
    }, "set reference to " + std::to_string(value) + "%");
}

Result<bool> Cu300::set_parameters(const std::vector<Assignment>& parameters)
{
    if (parameters.empty()) {
        return Result<bool>::failure(Error::OUT_OF_RANGE);
    }

    return send_command([this, &parameters]() {
        ValueAssignment values;
        values.parameters = parameters;
        return codec_.build_set_values(request_header(), values);
    }, "set parameters");
}

} // namespace genibus
