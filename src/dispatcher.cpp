#include "dispatcher.hpp"
#include "app_log.hpp"
#include <algorithm>

namespace torque_notify {

namespace {

std::string seconds_text(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    std::string text = std::to_string(ms / 1000);
    if (ms % 1000 != 0) {
        std::string frac = std::to_string(1000 + ms % 1000).substr(1);
        frac.erase(frac.find_last_not_of('0') + 1);
        text += "." + frac;
    }
    return text;
}

} // namespace

std::string failure_policy_to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::Continue: return "continue";
        case FailurePolicy::Abort: return "abort";
        default: return "unknown";
    }
}

Dispatcher::Dispatcher(EventQueue& queue, EventSink& sink, DispatcherOptions options)
    : queue_(queue)
    , sink_(sink)
    , options_(options)
{
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    if (running_) return;
    running_ = true;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        interrupted_ = false;
    }

    thread_ = std::thread([this]() {
        try {
            run();
        } catch (const DeliveryError& e) {
            AppLog::error("Dispatcher", std::string("Giving up: ") + e.what());
            running_ = false;
            if (on_failure_) on_failure_(e);
        }
    });
}

void Dispatcher::stop() {
    bool was_running = running_.exchange(false);
    if (was_running) {
        queue_.push_stop_front();
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            interrupted_ = true;
        }
        wait_cv_.notify_all();
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    if (was_running) {
        size_t dropped = queue_.clear();
        if (dropped > 0) {
            AppLog::warn("Dispatcher", "Discarded " + std::to_string(dropped) + " undelivered events");
        }
        AppLog::info("Dispatcher", "Stopped after " + std::to_string(delivered_.load()) + " deliveries");
    }
}

void Dispatcher::run() {
    while (true) {
        std::optional<Event> event = queue_.pop();
        if (!event) {
            return;
        }

        auto wait_time = deliver(*event);
        AppLog::info("Dispatcher", "Waiting for " + seconds_text(wait_time) + " seconds");
        pause(wait_time);
    }
}

std::chrono::milliseconds Dispatcher::deliver(const Event& event) {
    DeliveryResult result;
    try {
        result = sink_.deliver(event);
    } catch (const std::exception& e) {
        result = DeliveryResult::failed(e.what());
    }

    std::chrono::milliseconds retry_after{0};
    switch (result.status) {
        case DeliveryResult::Status::Delivered:
            delivered_++;
            break;
        case DeliveryResult::Status::RateLimited:
            rate_limited_++;
            retry_after = result.retry_after;
            AppLog::warn("Dispatcher", "Rate limited, retry after " + seconds_text(retry_after) + " seconds");
            break;
        case DeliveryResult::Status::Failed:
            failed_++;
            if (options_.failure_policy == FailurePolicy::Abort) {
                throw DeliveryError("Error posting message: " + result.error);
            }
            AppLog::warn("Dispatcher", "Error posting message: " + result.error);
            retry_after = options_.failure_cooldown;
            break;
    }

    return std::max(retry_after, options_.min_post_delay);
}

void Dispatcher::pause(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this]() { return interrupted_; });
}

DispatcherStats Dispatcher::stats() const {
    DispatcherStats s;
    s.delivered = delivered_;
    s.rate_limited = rate_limited_;
    s.failed = failed_;
    return s;
}

} // namespace torque_notify
