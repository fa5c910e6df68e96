// src/engine.cpp
// Delivery engine implementation.

#include "engine.hpp"
#include "frame_reader.hpp"
#include "identifier_access.hpp"
#include "log.hpp"

namespace pushgate {

DeliveryEngine::DeliveryEngine(ClientConfig config, std::shared_ptr<Dialer> dialer)
    : config_(std::move(config)),
      dialer_(std::move(dialer)),
      log_(logger_for(config_)),
      replay_(config_.replay_capacity()),
      reports_(config_.report_queue_size()) {
    report_thread_ = std::thread(&DeliveryEngine::run_reports, this);
    failure_thread_ = std::thread(&DeliveryEngine::run_failures, this);
}

DeliveryEngine::~DeliveryEngine() {
    close();
    if (report_thread_.joinable()) {
        report_thread_.join();
    }
    // Readers exit once their connection is closed; re-sends fail fast with NotRunning.
    join_tasks();
    // Deliver whatever failures are still queued, then stop the sink.
    failures_.close();
    if (failure_thread_.joinable()) {
        failure_thread_.join();
    }
}

// --- Sending ---

void DeliveryEngine::send(std::shared_ptr<Notification> notification) {
    if (!notification) {
        throw PushError::serialization("notification is null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        throw PushError::not_running();
    }

    detail::IdentifierAccess::assign(*notification, counter_);
    counter_ = (counter_ + 1) % config_.sequence_bound();

    auto bytes = notification->to_bytes();

    try {
        connect_and_write(bytes);
    } catch (const PushError& e) {
        discard_connection();
        post_failure(DeliveryFailure{notification, std::nullopt, e.message()});
        throw;
    }

    replay_.append(std::move(notification));
}

void DeliveryEngine::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        throw PushError::not_running();
    }
    if (!conn_) {
        open_connection();
    }
}

void DeliveryEngine::connect_and_write(const std::vector<uint8_t>& bytes) {
    if (!conn_) {
        open_connection();
    }
    if (conn_->write_all(bytes.data(), bytes.size())) {
        return; // Fast path: written on first try
    }

    log_->warn("write error on connection {}, reconnecting and trying again",
               static_cast<const void*>(conn_.get()));
    discard_connection();
    open_connection();

    if (!conn_->write_all(bytes.data(), bytes.size())) {
        throw PushError::write("write to " + config_.gateway() + " failed after reconnect");
    }
}

void DeliveryEngine::open_connection() {
    std::shared_ptr<Connection> conn;
    try {
        conn = dialer_->dial();
    } catch (const PushError& e) {
        log_->error("open connection to {} failed: {}", config_.gateway(), e.what());
        throw;
    }

    log_->info("opened connection {} to {}", static_cast<const void*>(conn.get()), config_.gateway());
    conn_ = conn;

    auto reader = std::make_shared<ErrorFrameReader>(
        std::move(conn),
        [this](const FailureReport& report) { enqueue_report(report); },
        [this](const std::shared_ptr<Connection>& retired) { retire(retired); },
        log_);
    spawn([reader]() { reader->run(); });
}

void DeliveryEngine::discard_connection() {
    if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

// --- Reader callbacks ---

void DeliveryEngine::retire(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;

    // A stale reader must not clear a connection opened after its own.
    if (conn_ == connection) {
        conn_.reset();
    }
}

void DeliveryEngine::enqueue_report(const FailureReport& report) {
    if (reports_.try_push(report)) return;

    if (reports_.closed()) {
        log_->debug("client closed, dropping report for identifier {}", report.identifier);
    } else {
        log_->warn("report queue full ({}), dropping report for identifier {}",
                   config_.report_queue_size(), report.identifier);
    }
}

// --- Failure handling ---

void DeliveryEngine::report_failure(const FailureReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;

    if (report.command == 0) {
        return; // no error
    }

    auto drained = replay_.drain_from(report.identifier);
    if (!drained.matched) {
        log_->warn("identifier {} is no longer in the replay queue; replay capacity {} is too small",
                   report.identifier, config_.replay_capacity());
        return;
    }

    log_->info("identifier {} rejected, re-sending {} later notification(s)",
               report.identifier, drained.tail.size());

    const char* reason = status_reason(report.status);
    post_failure(DeliveryFailure{drained.matched, report, reason ? reason : "unknown status"});

    replay_.clear();

    if (!drained.tail.empty()) {
        spawn([this, tail = std::move(drained.tail)]() { resend(tail); });
    }
}

void DeliveryEngine::resend(std::vector<std::shared_ptr<Notification>> notifications) {
    for (auto& notification : notifications) {
        try {
            send(notification);
        } catch (const PushError& e) {
            log_->warn("re-send of identifier {} failed: {}", notification->identifier(), e.what());
        }
    }
}

void DeliveryEngine::post_failure(DeliveryFailure failure) {
    if (!failures_.push(std::move(failure))) {
        log_->debug("failure sink closed, dropping failure");
    }
}

// --- Lifecycle ---

void DeliveryEngine::close() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        conn = std::move(conn_);
        replay_.clear();
    }

    reports_.close();
    if (conn) {
        conn->close();
    }
    log_->info("client for {} closed", config_.gateway());
}

bool DeliveryEngine::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t DeliveryEngine::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay_.size();
}

// --- Background threads ---

void DeliveryEngine::run_reports() {
    while (auto report = reports_.pop()) {
        report_failure(*report);
    }
}

void DeliveryEngine::run_failures() {
    while (auto failure = failures_.pop()) {
        const auto& callback = config_.on_failure();
        if (!callback) {
            log_->debug("no failure callback, dropping failure: {}", failure->reason);
            continue;
        }
        try {
            callback(*failure);
        } catch (const std::exception& e) {
            log_->error("failure callback threw: {}", e.what());
        }
    }
}

void DeliveryEngine::spawn(std::function<void()> body) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    // Reap finished threads before adding
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }

    Task task;
    task.done = done;
    task.thread = std::thread([body = std::move(body), done]() {
        body();
        done->store(true);
    });
    tasks_.push_back(std::move(task));
}

void DeliveryEngine::join_tasks() {
    for (;;) {
        std::vector<Task> tasks;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            tasks.swap(tasks_);
        }
        if (tasks.empty()) return;
        for (auto& t : tasks) {
            if (t.thread.joinable()) t.thread.join();
        }
    }
}

} // namespace pushgate
