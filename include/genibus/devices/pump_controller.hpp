#pragma once

#include "devices/cu300.hpp"
#include "common/types.hpp"
#include "common/catalog.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace genibus {

// Last poll result. After a failed poll the old values stay but are marked
// unavailable.
struct PumpSnapshot
{
    Values values;
    bool available = false;
    std::optional<Error> last_error;
    std::chrono::system_clock::time_point updated{};
};

// Coordinator between the application and the protocol engine: periodic poll,
// commands, and reconnect scheduling after connection loss.
class PumpController
{
public:
    using DataCallback = std::function<void(const PumpSnapshot&)>;
    using LogCallback = std::function<void(const std::string&)>;

    explicit PumpController(Cu300& engine);
    ~PumpController();

    PumpController(const PumpController&) = delete;
    PumpController& operator=(const PumpController&) = delete;

    Result<bool> setup();
    Result<Values> refresh();
    void shutdown();

    Result<bool> start_pump();
    Result<bool> stop_pump();
    Result<bool> set_reference(int value);

    void start_polling(std::chrono::seconds interval);
    void stop_polling();
    bool is_polling() const { return polling_.load(); }

    bool connected() const { return connected_.load(); }
    bool reconnect_pending() const { return reconnecting_.load(); }
    PumpSnapshot snapshot() const;

    // Blocks until a scheduled reconnect has finished
    void wait_for_reconnect();

    void set_data_callback(DataCallback cb) { data_callback_ = std::move(cb); }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    Cu300& engine_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> reconnecting_{false};
    std::atomic<bool> shutting_down_{false};
    std::mutex reconnect_mutex_;
    std::thread reconnect_thread_;

    mutable std::mutex snapshot_mutex_;
    PumpSnapshot snapshot_;

    std::atomic<bool> polling_{false};
    std::mutex poll_mutex_;
    std::condition_variable poll_cv_;
    std::thread poll_thread_;

    DataCallback data_callback_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    void mark_unavailable(Error error);
    void handle_connection_loss(Error error);
    void schedule_reconnect();
    Result<bool> after_command(const Result<bool>& result, const std::string& what);
};

} // namespace genibus
