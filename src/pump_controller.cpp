#include "devices/pump_controller.hpp"
#include "common/protocol.hpp"
#include "common/helpers.hpp"

namespace genibus {

PumpController::PumpController(Cu300& engine)
    : engine_(engine)
{
}

PumpController::~PumpController()
{
    shutdown();
}

void PumpController::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<bool> PumpController::setup()
{
    shutting_down_.store(false);
    engine_.clear_cancel();

    auto result = engine_.connect();
    if (!result.ok()) {
        log(std::string("[PUMP] Failed to connect: ") + error_name(result.error()));
        connected_.store(false);
        return result;
    }

    connected_.store(true);
    log("[PUMP] Connected");
    return result;
}

PumpSnapshot PumpController::snapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void PumpController::mark_unavailable(Error error)
{
    PumpSnapshot copy;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_.available = false;
        snapshot_.last_error = error;
        copy = snapshot_;
    }
    if (data_callback_) {
        data_callback_(copy);
    }
}

void PumpController::handle_connection_loss(Error error)
{
    log(std::string("[PUMP] Connection lost: ") + error_name(error));
    connected_.store(false);
    schedule_reconnect();
}

Result<Values> PumpController::refresh()
{
    if (!connected_.load()) {
        if (shutting_down_.load() || reconnecting_.load()) {
            mark_unavailable(Error::NOT_CONNECTED);
            return Result<Values>::failure(Error::NOT_CONNECTED);
        }

        log("[PUMP] Not connected, attempting to reconnect");
        auto reconnected = engine_.reconnect();
        if (!reconnected.ok()) {
            log(std::string("[PUMP] Failed to reconnect: ") + error_name(reconnected.error()));
            mark_unavailable(Error::NOT_CONNECTED);
            return Result<Values>::failure(Error::NOT_CONNECTED);
        }
        connected_.store(true);
        log("[PUMP] Reconnected");
    }

    auto data = engine_.poll_data();
    if (!data.ok()) {
        Error error = data.error();
        switch (data.kind()) {
        case ErrorKind::TIMEOUT:
            log("[PUMP] Timeout polling data");
            handle_connection_loss(error);
            break;
        case ErrorKind::CONNECTION:
            handle_connection_loss(error);
            break;
        default:
            log(std::string("[PUMP] Protocol error: ") + error_name(error));
            break;
        }
        mark_unavailable(error);
        return data;
    }

    PumpSnapshot copy;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_.values = data.value();
        snapshot_.available = true;
        snapshot_.last_error.reset();
        snapshot_.updated = std::chrono::system_clock::now();
        copy = snapshot_;
    }
    if (data_callback_) {
        data_callback_(copy);
    }
    return data;
}

void PumpController::schedule_reconnect()
{
    std::lock_guard<std::mutex> lock(reconnect_mutex_);

    if (shutting_down_.load() || reconnecting_.load()) {
        return;
    }
    if (reconnect_thread_.joinable()) {
        reconnect_thread_.join();
    }

    reconnecting_.store(true);
    reconnect_thread_ = std::thread([this]() {
        auto result = engine_.reconnect();
        if (result.ok()) {
            connected_.store(true);
            log("[PUMP] Reconnected");
        } else {
            log(std::string("[PUMP] Failed to reconnect: ") + error_name(result.error()));
        }
        reconnecting_.store(false);
    });
}

void PumpController::wait_for_reconnect()
{
    std::lock_guard<std::mutex> lock(reconnect_mutex_);
    if (reconnect_thread_.joinable()) {
        reconnect_thread_.join();
    }
}

Result<bool> PumpController::after_command(const Result<bool>& result, const std::string& what)
{
    if (!result.ok()) {
        log("[PUMP] Failed to " + what + ": " + error_name(result.error()));
        if (result.kind() == ErrorKind::CONNECTION || result.kind() == ErrorKind::TIMEOUT) {
            handle_connection_loss(result.error());
        }
        return result;
    }

    log("[PUMP] " + what + " done");

    auto update = refresh();
    if (!update.ok()) {
        log(std::string("[PUMP] Refresh after command failed: ") + error_name(update.error()));
    }
    return result;
}

Result<bool> PumpController::start_pump()
{
    if (!connected_.load()) {
        return Result<bool>::failure(Error::NOT_CONNECTED);
    }
    return after_command(engine_.start_pump(), "start pump");
}

Result<bool> PumpController::stop_pump()
{
    if (!connected_.load()) {
        return Result<bool>::failure(Error::NOT_CONNECTED);
    }
    return after_command(engine_.stop_pump(), "stop pump");
}

Result<bool> PumpController::set_reference(int value)
{
    if (value < Protocol::REFERENCE_MIN || value > Protocol::REFERENCE_MAX) {
        log("[PUMP] Reference " + std::to_string(value) + " rejected");
        return Result<bool>::failure(Error::OUT_OF_RANGE);
    }
    if (!connected_.load()) {
        return Result<bool>::failure(Error::NOT_CONNECTED);
    }
    return after_command(engine_.set_reference(value), "set reference to " + std::to_string(value) + "%");
}

void PumpController::start_polling(std::chrono::seconds interval)
{
    if (polling_.exchange(true)) {
        return;
    }

    poll_thread_ = std::thread([this, interval]() {
        log("[PUMP] Polling every " + std::to_string(interval.count()) + " s");
        while (polling_.load()) {
            auto data = refresh();
            if (data.ok()) {
                log("[PUMP] " + formatValues(data.value()));
            }

            std::unique_lock<std::mutex> lock(poll_mutex_);
            poll_cv_.wait_for(lock, interval, [this] { return !polling_.load(); });
        }
        log("[PUMP] Polling stopped");
    });
}

void PumpController::stop_polling()
{
    {
        std::lock_guard<std::mutex> lock(poll_mutex_);
        polling_.store(false);
    }
    poll_cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

void PumpController::shutdown()
{
    if (shutting_down_.exchange(true)) {
        return;
    }

    engine_.cancel();
    stop_polling();
    wait_for_reconnect();

    auto result = engine_.disconnect();
    if (!result.ok()) {
        log(std::string("[PUMP] Error disconnecting: ") + error_name(result.error()));
    }
    connected_.store(false);
    log("[PUMP] Shut down");
}

} // namespace genibus
