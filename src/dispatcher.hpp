#pragma once

#include "event_queue.hpp"
#include "event_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace torque_notify {

// What to do when the sink fails for a reason other than rate limiting
enum class FailurePolicy {
    Continue,                                 // Log, drop the event, wait the cooldown
    Abort                                     // Stop the dispatcher with a DeliveryError
};

struct DispatcherOptions {
    std::chrono::milliseconds min_post_delay{std::chrono::seconds(6)};
    std::chrono::milliseconds failure_cooldown{std::chrono::seconds(120)};
    FailurePolicy failure_policy = FailurePolicy::Continue;
};

class DeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DispatcherStats {
    uint64_t delivered = 0;
    uint64_t rate_limited = 0;
    uint64_t failed = 0;
};

// Sole consumer of the event queue. Delivers one event at a time and waits
// max(retry_after, min_post_delay) after every attempt.
class Dispatcher {
public:
    using FailureHandler = std::function<void(const DeliveryError& error)>;

    Dispatcher(EventQueue& queue, EventSink& sink, DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Runs on the dispatcher thread after an Abort; must not call stop()
    void set_failure_handler(FailureHandler handler) { on_failure_ = std::move(handler); }

    // Runs run() on a dedicated thread
    void start();

    // Stop signal ahead of anything queued; interrupts the post-delivery wait
    void stop();

    bool is_running() const { return running_; }

    // Delivers until the stop signal is dequeued. Throws DeliveryError under FailurePolicy::Abort.
    void run();

    DispatcherStats stats() const;

private:
    // Returns the wait before the next pull
    std::chrono::milliseconds deliver(const Event& event);
    void pause(std::chrono::milliseconds duration);

    EventQueue& queue_;
    EventSink& sink_;
    DispatcherOptions options_;
    FailureHandler on_failure_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool interrupted_{false};

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> failed_{0};
};

std::string failure_policy_to_string(FailurePolicy policy);

} // namespace torque_notify
