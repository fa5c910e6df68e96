// src/replay_queue.cpp

#include "replay_queue.hpp"

namespace pushgate {

ReplayQueue::ReplayQueue(size_t capacity) : capacity_(capacity) {}

void ReplayQueue::append(std::shared_ptr<Notification> notification) {
    if (capacity_ == 0) return;
    while (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(notification));
}

ReplayQueue::Drained ReplayQueue::drain_from(int32_t identifier) {
    Drained result;

    auto it = entries_.begin();
    for (; it != entries_.end(); ++it) {
        if ((*it)->identifier() == identifier) break;
    }
    if (it == entries_.end()) {
        return result;
    }

    result.matched = std::move(*it);
    for (++it; it != entries_.end(); ++it) {
        result.tail.push_back(std::move(*it));
    }
    entries_.clear();
    return result;
}

} // namespace pushgate
