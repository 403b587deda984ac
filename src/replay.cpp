#include "replay.hpp"
#include "app_log.hpp"
#include "directory_watcher.hpp"
#include "line_parser.hpp"
#include "tail_buffer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <queue>

namespace torque_notify {

std::vector<std::string> select_replay_window(const std::string& directory, size_t max_files) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        throw TailerError(TailerErrorKind::FilesystemWatchFailed,
                          "Failed to list " + directory + ": " + ec.message());
    }

    std::vector<std::pair<std::filesystem::file_time_type, std::string>> files;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        files.emplace_back(mtime, entry.path().string());
    }

    std::sort(files.begin(), files.end());

    size_t first = files.size() > max_files ? files.size() - max_files : 0;
    std::vector<std::string> window;
    for (size_t i = first; i < files.size(); i++) {
        window.push_back(files[i].second);
    }
    return window;
}

DirectoryReplay replay_directory(const std::string& directory, EventSource source, size_t max_files) {
    DirectoryReplay replay;
    replay.directory = directory;
    replay.source = source;

    auto window = select_replay_window(directory, max_files);
    for (size_t i = 0; i < window.size(); i++) {
        const auto& path = window[i];
        bool newest = (i + 1 == window.size());

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            AppLog::warn("Replay", "Unable to open " + path);
            continue;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        TailBuffer buffer;
        auto lines = buffer.feed(content);
        std::uintmax_t consumed = content.size() - buffer.pending().size();
        if (!newest && !buffer.pending().empty()) {
            // A rotated file will not grow any more, its last line is complete
            lines.push_back(buffer.pending());
            consumed = content.size();
        }

        for (const auto& line : lines) {
            if (line.empty()) continue;
            try {
                replay.events.push_back(parse_line(source, line));
            } catch (const ParseError& e) {
                AppLog::warn("Replay", std::string(parse_error_kind_name(e.kind())) + ": " + e.what());
                replay.skipped_lines++;
            }
        }

        replay.files.push_back({path, consumed});
    }

    AppLog::info("Replay", "Read " + std::to_string(replay.events.size()) + " " +
                 source_to_string(source) + " events from " +
                 std::to_string(replay.files.size()) + " files in " + directory);
    return replay;
}

std::vector<Event> merge_by_timestamp(std::vector<std::vector<Event>> sequences) {
    struct Head {
        size_t sequence;
        size_t index;
    };

    auto later = [&sequences](const Head& a, const Head& b) {
        const auto& ta = sequences[a.sequence][a.index].timestamp;
        const auto& tb = sequences[b.sequence][b.index].timestamp;
        if (ta != tb) return ta > tb;
        return a.sequence > b.sequence;
    };
    std::priority_queue<Head, std::vector<Head>, decltype(later)> heads(later);

    size_t total = 0;
    for (size_t s = 0; s < sequences.size(); s++) {
        total += sequences[s].size();
        if (!sequences[s].empty()) {
            heads.push({s, 0});
        }
    }

    std::vector<Event> merged;
    merged.reserve(total);
    while (!heads.empty()) {
        Head head = heads.top();
        heads.pop();
        merged.push_back(std::move(sequences[head.sequence][head.index]));
        if (head.index + 1 < sequences[head.sequence].size()) {
            heads.push({head.sequence, head.index + 1});
        }
    }
    return merged;
}

} // namespace torque_notify
