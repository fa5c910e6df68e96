// src/replay_queue.hpp
// Bounded, insertion-ordered record of notifications still in flight.

#pragma once

#include "pushgate/notification.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

namespace pushgate {

// Notifications that were written but may not have been processed.
//
// The gateway reports only the first notification it rejected on a
// connection; everything written after it is of unknown fate. The queue
// keeps the most recent `capacity` notifications in send order so that a
// single failure identifier can be expanded into "that one plus everything
// after it". Identifiers are unique only among the resident entries.
//
// Not thread-safe; the owner serializes access.
class ReplayQueue {
public:
    struct Drained {
        std::shared_ptr<Notification> matched;             // nullptr if not found
        std::vector<std::shared_ptr<Notification>> tail;   // entries after the match
    };

    explicit ReplayQueue(size_t capacity);

    // Append at the newest end, evicting the oldest entry when full.
    void append(std::shared_ptr<Notification> notification);

    // Find `identifier` scanning oldest to newest. On a match, return it with
    // every later entry in send order and empty the queue; entries older than
    // the match are dropped with it. On a miss, return an empty result and
    // leave the queue untouched.
    Drained drain_from(int32_t identifier);

    void clear() noexcept { entries_.clear(); }

    size_t size() const noexcept { return entries_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return entries_.empty(); }

private:
    size_t capacity_;
    std::deque<std::shared_ptr<Notification>> entries_;
};

} // namespace pushgate
