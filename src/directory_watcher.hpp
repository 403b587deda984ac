#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace torque_notify {

enum class TailerErrorKind {
    UnexpectedConcurrentWrite,
    FilesystemWatchFailed
};

const char* tailer_error_kind_name(TailerErrorKind kind);

// Structural failure of a watched directory; the owning tailer cannot continue
class TailerError : public std::runtime_error {
public:
    TailerError(TailerErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    TailerErrorKind kind() const { return kind_; }

private:
    TailerErrorKind kind_;
};

// Rescan is reported when notifications were lost; `path` is the directory
struct DirectoryChange {
    enum class Kind { Created, Modified, Rescan };

    Kind kind;
    std::string path;
};

// Source of file notifications for one directory
class DirectoryWatcher {
public:
    virtual ~DirectoryWatcher() = default;

    // Blocks up to `timeout`. An empty result means nothing happened.
    // Throws TailerError(FilesystemWatchFailed) when the watch is lost.
    virtual std::vector<DirectoryChange> wait(std::chrono::milliseconds timeout) = 0;

    virtual const std::string& directory() const = 0;
};

class InotifyWatcher : public DirectoryWatcher {
public:
    explicit InotifyWatcher(const std::string& directory);
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    std::vector<DirectoryChange> wait(std::chrono::milliseconds timeout) override;
    const std::string& directory() const override { return directory_; }

private:
    std::string directory_;
    int inotify_fd_ = -1;
    int watch_fd_ = -1;
};

// Rescans the directory listing; for filesystems without inotify (NFS spool mounts).
// At most one scan per `interval`, however short the wait timeout is.
class PollingWatcher : public DirectoryWatcher {
public:
    explicit PollingWatcher(const std::string& directory,
                            std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    std::vector<DirectoryChange> wait(std::chrono::milliseconds timeout) override;
    const std::string& directory() const override { return directory_; }

private:
    struct FileState {
        std::uintmax_t size = 0;
        std::filesystem::file_time_type write_time{};
    };

    std::map<std::string, FileState> scan() const;

    std::string directory_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_scan_;
    std::map<std::string, FileState> files_;
};

enum class WatchMode { Inotify, Poll };

std::unique_ptr<DirectoryWatcher> make_directory_watcher(
    const std::string& directory, WatchMode mode,
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

} // namespace torque_notify
