#include "directory_watcher.hpp"
#include "app_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace torque_notify {

const char* tailer_error_kind_name(TailerErrorKind kind) {
    switch (kind) {
        case TailerErrorKind::UnexpectedConcurrentWrite: return "UnexpectedConcurrentWrite";
        case TailerErrorKind::FilesystemWatchFailed: return "FilesystemWatchFailed";
        default: return "Unknown";
    }
}

// ---------------------------------------------------------------------------
// InotifyWatcher

InotifyWatcher::InotifyWatcher(const std::string& directory)
    : directory_(directory)
{
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          std::string("Failed to initialize inotify: ") + std::strerror(errno));
    }

    watch_fd_ = inotify_add_watch(inotify_fd_, directory_.c_str(),
                                  IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_ONLYDIR);
    if (watch_fd_ < 0) {
        int err = errno;
        close(inotify_fd_);
        inotify_fd_ = -1;
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          "Failed to watch " + directory_ + ": " + std::strerror(err));
    }
}

InotifyWatcher::~InotifyWatcher() {
    if (inotify_fd_ >= 0) {
        if (watch_fd_ >= 0) {
            inotify_rm_watch(inotify_fd_, watch_fd_);
        }
        close(inotify_fd_);
    }
}

std::vector<DirectoryChange> InotifyWatcher::wait(std::chrono::milliseconds timeout) {
    std::vector<DirectoryChange> changes;

    struct pollfd pfd;
    pfd.fd = inotify_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) return changes;
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          "poll failed on " + directory_ + ": " + std::strerror(errno));
    }
    if (rc == 0) return changes;

    alignas(struct inotify_event) char buffer[16 * 1024];
    while (true) {
        ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                              "read failed on " + directory_ + ": " + std::strerror(errno));
        }
        if (len == 0) break;

        for (char* ptr = buffer; ptr < buffer + len; ) {
            auto* event = reinterpret_cast<struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                AppLog::warn("Watcher", "inotify queue overflow on " + directory_ + ", rescanning");
                changes.push_back({DirectoryChange::Kind::Rescan, directory_});
                continue;
            }
            if (event->mask & (IN_IGNORED | IN_UNMOUNT)) {
                throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                                  "Watch on " + directory_ + " was removed");
            }
            if ((event->mask & IN_ISDIR) || event->len == 0) {
                continue;
            }

            std::string path = (std::filesystem::path(directory_) / event->name).string();
            if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
                changes.push_back({DirectoryChange::Kind::Created, path});
            } else if (event->mask & IN_MODIFY) {
                changes.push_back({DirectoryChange::Kind::Modified, path});
            }
        }
    }

    return changes;
}

// ---------------------------------------------------------------------------
// PollingWatcher

PollingWatcher::PollingWatcher(const std::string& directory, std::chrono::milliseconds interval)
    : directory_(directory)
    , interval_(interval)
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
    files_ = scan();
    last_scan_ = std::chrono::steady_clock::now();
}

std::map<std::string, PollingWatcher::FileState> PollingWatcher::scan() const {
    std::map<std::string, FileState> result;

    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          "Failed to list " + directory_ + ": " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        FileState state;
        state.size = entry.file_size(entry_ec);
        if (entry_ec) continue;  // Removed between listing and stat
        state.write_time = entry.last_write_time(entry_ec);
        if (entry_ec) continue;

        result[entry.path().string()] = state;
    }

    return result;
}

std::vector<DirectoryChange> PollingWatcher::wait(std::chrono::milliseconds timeout) {
    auto due = last_scan_ + interval_;
    auto now = std::chrono::steady_clock::now();
    if (now < due) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(due - now);
        if (remaining > timeout) {
            std::this_thread::sleep_for(timeout);
            return {};
        }
        std::this_thread::sleep_for(due - now);
    }

    auto current = scan();
    last_scan_ = std::chrono::steady_clock::now();

    std::vector<std::pair<std::string, FileState>> created;
    std::vector<DirectoryChange> changes;

    for (const auto& [path, state] : current) {
        auto it = files_.find(path);
        if (it == files_.end()) {
            created.emplace_back(path, state);
        } else if (it->second.size != state.size || it->second.write_time != state.write_time) {
            changes.push_back({DirectoryChange::Kind::Modified, path});
        }
    }

    // Final writes to known files come before any rotation. New files are
    // reported oldest first so that the newest one ends up active.
    std::sort(created.begin(), created.end(), [](const auto& a, const auto& b) {
        if (a.second.write_time != b.second.write_time) {
            return a.second.write_time < b.second.write_time;
        }
        return a.first < b.first;
    });

    for (const auto& [path, state] : created) {
        changes.push_back({DirectoryChange::Kind::Created, path});
        if (state.size > 0) {
            changes.push_back({DirectoryChange::Kind::Modified, path});
        }
    }

    files_ = std::move(current);
    return changes;
}

std::unique_ptr<DirectoryWatcher> make_directory_watcher(
    const std::string& directory, WatchMode mode, std::chrono::milliseconds poll_interval)
{
    if (mode == WatchMode::Poll) {
        return std::make_unique<PollingWatcher>(directory, poll_interval);
    }
    return std::make_unique<InotifyWatcher>(directory);
}

} // namespace torque_notify
