#pragma once

#include "event.hpp"
#include <chrono>
#include <ostream>
#include <mutex>
#include <string>

namespace torque_notify {

struct DeliveryResult {
    enum class Status { Delivered, RateLimited, Failed };

    Status status = Status::Delivered;
    std::chrono::milliseconds retry_after{0};  // Only meaningful when RateLimited
    std::string error;

    static DeliveryResult delivered() { return {}; }

    static DeliveryResult rate_limited(std::chrono::milliseconds retry_after) {
        DeliveryResult r;
        r.status = Status::RateLimited;
        r.retry_after = retry_after;
        return r;
    }

    static DeliveryResult failed(const std::string& error) {
        DeliveryResult r;
        r.status = Status::Failed;
        r.error = error;
        return r;
    }
};

// Downstream notification target. Called from the dispatcher thread only.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual DeliveryResult deliver(const Event& event) = 0;
};

// One JSON document per line, for --print
class ConsoleSink : public EventSink {
public:
    explicit ConsoleSink(std::ostream& out) : out_(out) {}

    DeliveryResult deliver(const Event& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace torque_notify
