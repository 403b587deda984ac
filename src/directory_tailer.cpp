#include "directory_tailer.hpp"
#include "app_log.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <utility>
#include <vector>

namespace torque_notify {

namespace {

constexpr auto kWaitTimeout = std::chrono::milliseconds(200);

std::uintmax_t current_size(const std::string& path, std::uintmax_t fallback) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? fallback : size;
}

} // namespace

DirectoryTailer::DirectoryTailer(const std::string& name,
                                 std::unique_ptr<DirectoryWatcher> watcher,
                                 LineHandler on_line)
    : name_(name)
    , watcher_(std::move(watcher))
    , on_line_(std::move(on_line))
{
}

DirectoryTailer::~DirectoryTailer() {
    stop();
}

void DirectoryTailer::resume_from(const std::string& path, std::uintmax_t offset) {
    activate(path, offset);
}

void DirectoryTailer::retire(const std::string& path, std::uintmax_t size) {
    remember_retired(path, size);
}

void DirectoryTailer::remember_retired(const std::string& path, std::uintmax_t size) {
    forget_retired(path);
    retired_.emplace_back(path, size);
    while (retired_.size() > kMaxRetiredFiles) {
        retired_.pop_front();
    }
}

void DirectoryTailer::forget_retired(const std::string& path) {
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [&path](const auto& entry) { return entry.first == path; }),
                   retired_.end());
}

void DirectoryTailer::start() {
    if (running_) return;
    running_ = true;

    AppLog::info(component(), "Watching " + directory() +
                 (active_path_.empty() ? std::string(" (no active file)")
                                       : " from " + active_path_ + " @ " + std::to_string(offset_)));

    thread_ = std::thread([this]() {
        monitor_loop();
    });
}

void DirectoryTailer::stop() {
    bool was_running = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (file_.is_open()) {
        file_.close();
    }
    if (was_running) {
        AppLog::info(component(), "Stopped watching " + directory());
    }
}

void DirectoryTailer::monitor_loop() {
    try {
        // Bytes written between replay and the first notification
        if (state() == State::Watching) {
            read_appended();
        }
    } catch (const TailerError& e) {
        AppLog::error(component(), std::string(tailer_error_kind_name(e.kind())) + ": " + e.what());
        running_ = false;
        if (on_failure_) on_failure_(name_, e);
        return;
    }

    while (running_) {
        try {
            auto changes = watcher_->wait(kWaitTimeout);
            for (const auto& change : changes) {
                if (!running_) break;
                handle(change);
            }
        } catch (const TailerError& e) {
            AppLog::error(component(), std::string(tailer_error_kind_name(e.kind())) + ": " + e.what());
            running_ = false;
            if (on_failure_) on_failure_(name_, e);
            return;
        } catch (const std::exception& e) {
            AppLog::error(component(), std::string("Error reading directory: ") + e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

void DirectoryTailer::handle(const DirectoryChange& change) {
    switch (change.kind) {
        case DirectoryChange::Kind::Created: on_created(change.path); break;
        case DirectoryChange::Kind::Modified: on_modified(change.path); break;
        case DirectoryChange::Kind::Rescan: on_rescan(); break;
    }
}

void DirectoryTailer::on_created(const std::string& path) {
    if (path == active_path_) return;

    if (!active_path_.empty()) {
        AppLog::info(component(), "Rotated " + active_path_ + " -> " + path);
        remember_retired(active_path_, current_size(active_path_, offset_));
    }
    activate(path, 0);
}

void DirectoryTailer::on_modified(const std::string& path) {
    if (active_path_.empty()) {
        activate(path, 0);
    } else if (path != active_path_) {
        // Notifications queued before a rotation are harmless as long as
        // the file did not grow since it was left behind.
        auto it = std::find_if(retired_.begin(), retired_.end(),
                               [&path](const auto& entry) { return entry.first == path; });
        if (it != retired_.end() && current_size(path, it->second) <= it->second) {
            return;
        }
        throw TailerError(TailerErrorKind::UnexpectedConcurrentWrite,
                          "Unexpected modifications to " + path + " while tailing " + active_path_);
    }

    if (path == active_path_) {
        read_appended();
    }
}

// Notifications were lost: finish the active file, then take over every file
// written after it, oldest first.
void DirectoryTailer::on_rescan() {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory(), ec);
    if (ec) {
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          "Failed to list " + directory() + ": " + ec.message());
    }

    std::vector<std::pair<std::filesystem::file_time_type, std::string>> files;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto write_time = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        files.emplace_back(write_time, entry.path().string());
    }
    std::sort(files.begin(), files.end());

    std::filesystem::file_time_type active_time = std::filesystem::file_time_type::min();
    if (!active_path_.empty()) {
        auto found = std::find_if(files.begin(), files.end(),
                                  [this](const auto& f) { return f.second == active_path_; });
        read_appended();
        if (found == files.end()) {
            AppLog::warn(component(), "Active file " + active_path_ + " is gone, rescan skipped");
            return;
        }
        active_time = found->first;
    }

    AppLog::info(component(), "Rescanning " + directory());
    for (const auto& [write_time, path] : files) {
        if (path == active_path_ || write_time <= active_time) continue;
        on_created(path);
        if (path == active_path_) {
            read_appended();
        }
    }
}

void DirectoryTailer::activate(const std::string& path, std::uintmax_t offset) {
    std::ifstream next(path, std::ios::in | std::ios::binary);
    if (!next.is_open()) {
        AppLog::warn(component(), "Unable to open " + path + ", keeping " +
                     (active_path_.empty() ? std::string("no active file") : active_path_));
        return;
    }

    if (file_.is_open()) {
        file_.close();
    }
    file_ = std::move(next);
    active_path_ = path;
    offset_ = offset;
    buffer_.reset();
    forget_retired(path);
}

void DirectoryTailer::read_appended() {
    if (!file_.is_open()) return;

    auto size = current_size(active_path_, offset_);
    if (size < offset_) {
        AppLog::warn(component(), "File truncated, resetting position: " + active_path_);
        offset_ = 0;
        buffer_.reset();
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset_));

    std::string data;
    char chunk[8192];
    while (file_.read(chunk, sizeof(chunk)) || file_.gcount() > 0) {
        data.append(chunk, static_cast<size_t>(file_.gcount()));
    }
    file_.clear();

    if (data.empty()) return;
    offset_ += data.size();

    // offset_ already covers the batch; a failing line is dropped on its own
    for (const auto& line : buffer_.feed(data)) {
        try {
            on_line_(line);
        } catch (const std::exception& e) {
            AppLog::error(component(), "Dropped line from " + active_path_ + ": " + e.what());
        }
    }
}

} // namespace torque_notify
