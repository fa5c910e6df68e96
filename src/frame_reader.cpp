// src/frame_reader.cpp

#include "frame_reader.hpp"
#include "encoding.hpp"

#include <spdlog/fmt/bin_to_hex.h>

namespace pushgate {

ErrorFrameReader::ErrorFrameReader(std::shared_ptr<Connection> connection, ReportFn on_report,
                                   RetireFn on_retire, std::shared_ptr<spdlog::logger> log)
    : connection_(std::move(connection)),
      on_report_(std::move(on_report)),
      on_retire_(std::move(on_retire)),
      log_(std::move(log)) {}

ErrorFrameReader::Outcome ErrorFrameReader::run() {
    FailureReport report;
    Outcome outcome = read_frame(report);

    // Retire first so that re-sends triggered by the report dial a fresh connection.
    connection_->close();
    if (on_retire_) on_retire_(connection_);

    if (outcome == Outcome::Reported && on_report_) {
        on_report_(report);
    }

    state_.store(State::Done);
    return outcome;
}

ErrorFrameReader::Outcome ErrorFrameReader::read_frame(FailureReport& report) {
    uint8_t frame[kErrorResponseLength];
    if (!connection_->read_exact(frame, sizeof(frame))) {
        log_->warn("connection {} closed without an error response",
                   static_cast<const void*>(connection_.get()));
        return Outcome::SocketClosed;
    }

    report = encoding::decode_error_response(frame);

    if (report.command != kErrorResponseCommand) {
        log_->warn("unknown error response command {}: {}", static_cast<unsigned>(report.command),
                   spdlog::to_hex(frame, frame + sizeof(frame)));
        return Outcome::UnknownCommand;
    }

    const char* reason = status_reason(report.status);
    if (reason == nullptr) {
        log_->warn("unknown error response status {}: {}", static_cast<unsigned>(report.status),
                   spdlog::to_hex(frame, frame + sizeof(frame)));
        return Outcome::UnknownStatus;
    }

    log_->warn("gateway rejected identifier {}: {} (status {})", report.identifier, reason,
               static_cast<unsigned>(report.status));
    return Outcome::Reported;
}

} // namespace pushgate
