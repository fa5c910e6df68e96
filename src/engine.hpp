// src/engine.hpp
// Delivery engine: sequence assignment, send/retry, replay after reported failures.

#pragma once

#include "channel.hpp"
#include "connection.hpp"
#include "replay_queue.hpp"
#include "pushgate/config.hpp"
#include "pushgate/notification.hpp"
#include "pushgate/types.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pushgate {

class DeliveryEngine {
public:
    // Starts the report and failure-sink threads. Connections come from dialer.
    DeliveryEngine(ClientConfig config, std::shared_ptr<Dialer> dialer);

    // Closes, then joins every background thread.
    ~DeliveryEngine();

    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    // Assign the next identifier, encode, write (with one reconnect-retry)
    // and record the notification as in flight.
    // Throws PushError (NotRunning, Serialization, Certificate, Connect, Write).
    void send(std::shared_ptr<Notification> notification);

    // Open the connection if none is cached. Throws PushError.
    void connect();

    // Handle a gateway failure report: surface the rejected notification and
    // re-submit everything written after it. No-op once closed.
    void report_failure(const FailureReport& report);

    // Stop accepting work and close the connection. Idempotent; does not join.
    void close();

    bool running() const;

    // Notifications currently held for replay.
    size_t in_flight() const;

    const ClientConfig& config() const noexcept { return config_; }

private:
    // A managed background thread; done is set when its body returns.
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // All of the following require mutex_ to be held.
    void connect_and_write(const std::vector<uint8_t>& bytes);
    void open_connection();
    void discard_connection();

    // Reader callbacks, called without mutex_.
    void retire(const std::shared_ptr<Connection>& connection);
    void enqueue_report(const FailureReport& report);

    void post_failure(DeliveryFailure failure);
    void resend(std::vector<std::shared_ptr<Notification>> notifications);
    void spawn(std::function<void()> body);
    void join_tasks();

    void run_reports();
    void run_failures();

    ClientConfig config_;
    std::shared_ptr<Dialer> dialer_;
    std::shared_ptr<spdlog::logger> log_;

    // Send lock: guards everything down to conn_.
    mutable std::mutex mutex_;
    bool running_ = true;
    int32_t counter_ = 0;
    ReplayQueue replay_;
    std::shared_ptr<Connection> conn_;

    // Reader -> report_thread_ -> report_failure()
    Channel<FailureReport> reports_;
    std::thread report_thread_;

    // post_failure() -> failure_thread_ -> on_failure callback
    Channel<DeliveryFailure> failures_;
    std::thread failure_thread_;

    // Frame readers and re-send tasks (joined on shutdown instead of detached)
    std::mutex tasks_mutex_;
    std::vector<Task> tasks_;
};

} // namespace pushgate
