#pragma once

#include "directory_watcher.hpp"
#include "tail_buffer.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace torque_notify {

// Follows the single file being written in one log directory. A newly created
// file replaces the active one (rotation); a write to any other file is fatal.
class DirectoryTailer {
public:
    enum class State { Idle, Watching };

    using LineHandler = std::function<void(const std::string& line)>;
    // Runs on the tailer thread after it has stopped itself; must not call stop()
    using FailureHandler = std::function<void(const std::string& name, const TailerError& error)>;

    DirectoryTailer(const std::string& name, std::unique_ptr<DirectoryWatcher> watcher,
                    LineHandler on_line);
    ~DirectoryTailer();

    DirectoryTailer(const DirectoryTailer&) = delete;
    DirectoryTailer& operator=(const DirectoryTailer&) = delete;

    void set_failure_handler(FailureHandler handler) { on_failure_ = std::move(handler); }

    // Continue `path` from byte `offset` (the end of what replay consumed). Call before start().
    void resume_from(const std::string& path, std::uintmax_t offset);

    // Record a file that was fully consumed before this tailer took over
    void retire(const std::string& path, std::uintmax_t size);

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Applies one notification. Driven by the watch loop once started.
    void handle(const DirectoryChange& change);

    // Reads everything appended to the active file since the last read
    void read_appended();

    State state() const { return active_path_.empty() ? State::Idle : State::Watching; }
    const std::string& name() const { return name_; }
    const std::string& directory() const { return watcher_->directory(); }
    const std::string& active_path() const { return active_path_; }
    std::uintmax_t offset() const { return offset_; }
    const std::string& pending_fragment() const { return buffer_.pending(); }
    std::size_t retired_count() const { return retired_.size(); }

    // Retired files remembered for stale notifications; older ones are forgotten
    static constexpr std::size_t kMaxRetiredFiles = 8;

private:
    void monitor_loop();
    void activate(const std::string& path, std::uintmax_t offset);
    void on_created(const std::string& path);
    void on_modified(const std::string& path);
    void on_rescan();
    void remember_retired(const std::string& path, std::uintmax_t size);
    void forget_retired(const std::string& path);
    std::string component() const { return "Tailer:" + name_; }

    std::string name_;
    std::unique_ptr<DirectoryWatcher> watcher_;
    LineHandler on_line_;
    FailureHandler on_failure_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::string active_path_;
    std::ifstream file_;
    std::uintmax_t offset_{0};
    TailBuffer buffer_;

    // Previously active files and their size when they were left behind, oldest first
    std::deque<std::pair<std::string, std::uintmax_t>> retired_;
};

} // namespace torque_notify
