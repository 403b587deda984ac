#pragma once

#include "directory_tailer.hpp"
#include "event_queue.hpp"
#include "replay.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace torque_notify {

struct CollectorOptions {
    std::string server_logs;
    std::string accounting_logs;
    size_t replay_files = kDefaultReplayFiles;
    WatchMode watch_mode = WatchMode::Inotify;
    std::chrono::milliseconds poll_interval{200};
};

// Owns the server log and accounting log tailers and feeds both into one queue.
// Watches are established on construction so nothing written during replay is missed.
class LogCollector {
public:
    LogCollector(EventQueue& queue, const CollectorOptions& options);
    ~LogCollector();

    LogCollector(const LogCollector&) = delete;
    LogCollector& operator=(const LogCollector&) = delete;

    void set_failure_handler(DirectoryTailer::FailureHandler handler);

    // Pushes the recent history of both directories in timestamp order and
    // positions each tailer where its replay ended. Returns the number of events.
    size_t replay();

    void start();
    void stop();

    DirectoryTailer& server_tailer() { return *server_tailer_; }
    DirectoryTailer& accounting_tailer() { return *accounting_tailer_; }

    // Parses one live line and queues the event; failures are logged and dropped
    static void handle_line(EventQueue& queue, EventSource source, const std::string& line);

private:
    void hand_off(DirectoryTailer& tailer, const DirectoryReplay& replay);

    EventQueue& queue_;
    CollectorOptions options_;
    std::unique_ptr<DirectoryTailer> server_tailer_;
    std::unique_ptr<DirectoryTailer> accounting_tailer_;
};

} // namespace torque_notify
