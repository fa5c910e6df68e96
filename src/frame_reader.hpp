// src/frame_reader.hpp
// Single-shot listener for the gateway's error-response frame.

#pragma once

#include "connection.hpp"
#include "pushgate/types.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <functional>
#include <memory>

namespace pushgate {

// Reads at most one error-response frame from one connection.
//
// The gateway writes at most one error frame per connection and then
// stops processing it, so the reader performs exactly one blocking read
// and is then Done; it is not a loop. Whatever the outcome, the connection
// is closed and handed to on_retire, so the owner can drop it if it is still
// the current one. Only a well-formed frame with a known status then reaches
// on_report, which must not block: the reader's exit may not wait on the
// consumer of reports.
class ErrorFrameReader {
public:
    enum class State { Waiting, Done };

    enum class Outcome {
        Reported,        // frame parsed and passed to on_report
        SocketClosed,    // read error or close; nothing reported
        UnknownCommand,  // command byte is not an error response; discarded
        UnknownStatus,   // status not in the reason table; discarded
    };

    using ReportFn = std::function<void(const FailureReport&)>;
    using RetireFn = std::function<void(const std::shared_ptr<Connection>&)>;

    ErrorFrameReader(std::shared_ptr<Connection> connection, ReportFn on_report,
                     RetireFn on_retire, std::shared_ptr<spdlog::logger> log);

    // Blocks until the frame arrives or the connection ends. Call once.
    Outcome run();

    State state() const noexcept { return state_.load(); }

private:
    Outcome read_frame(FailureReport& report);

    std::shared_ptr<Connection> connection_;
    ReportFn on_report_;
    RetireFn on_retire_;
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<State> state_{State::Waiting};
};

} // namespace pushgate
