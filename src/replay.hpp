#pragma once

#include "event.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace torque_notify {

constexpr size_t kDefaultReplayFiles = 7;

struct ReplayedFile {
    std::string path;
    std::uintmax_t consumed = 0;              // Bytes turned into lines
};

struct DirectoryReplay {
    std::string directory;
    EventSource source = EventSource::ServerLog;
    std::vector<Event> events;                // In file order
    std::vector<ReplayedFile> files;          // Oldest first; the last one is still being written
    size_t skipped_lines = 0;

    // Where live tailing continues, if the directory had any files
    std::optional<ReplayedFile> resume() const {
        if (files.empty()) return std::nullopt;
        return files.back();
    }
};

// The `max_files` most recently modified regular files, oldest first
std::vector<std::string> select_replay_window(const std::string& directory, size_t max_files);

// Reads and parses the replay window of one directory. Unparsable lines are
// logged and skipped. The unterminated tail of the newest file is left for
// the live tailer.
DirectoryReplay replay_directory(const std::string& directory, EventSource source,
                                 size_t max_files = kDefaultReplayFiles);

// Stable k-way merge of sequences already ordered by timestamp. Equal
// timestamps keep the order of the input sequences.
std::vector<Event> merge_by_timestamp(std::vector<std::vector<Event>> sequences);

} // namespace torque_notify
