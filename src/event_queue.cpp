#include "event_queue.hpp"

namespace torque_notify {

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.emplace_back(std::move(event));
    }
    cv_.notify_one();
}

void EventQueue::push_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.emplace_back(std::nullopt);
    }
    cv_.notify_one();
}

void EventQueue::push_stop_front() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.emplace_front(std::nullopt);
    }
    cv_.notify_one();
}

std::optional<Event> EventQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !items_.empty(); });
    std::optional<Event> item = std::move(items_.front());
    items_.pop_front();
    return item;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

size_t EventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t events = 0;
    for (const auto& item : items_) {
        if (item) events++;
    }
    items_.clear();
    return events;
}

} // namespace torque_notify
