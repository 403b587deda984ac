#pragma once

#include "event.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace torque_notify {

// Unbounded FIFO from the replay and the tailers to the dispatcher.
// An empty optional is the stop signal.
class EventQueue {
public:
    void push(Event event);

    // Places the stop signal behind everything already queued
    void push_stop();

    // Places the stop signal ahead of everything already queued
    void push_stop_front();

    // Blocks until an item is available; std::nullopt means stop
    std::optional<Event> pop();

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Drops everything still queued, returns the number of events dropped
    size_t clear();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::optional<Event>> items_;
};

} // namespace torque_notify
