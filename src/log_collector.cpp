#include "log_collector.hpp"
#include "app_log.hpp"
#include "line_parser.hpp"

namespace torque_notify {

LogCollector::LogCollector(EventQueue& queue, const CollectorOptions& options)
    : queue_(queue)
    , options_(options)
{
    AppLog::info("Collector", "Collecting server logs from " + options_.server_logs);
    AppLog::info("Collector", "Collecting accounting logs from " + options_.accounting_logs);

    server_tailer_ = std::make_unique<DirectoryTailer>(
        "server",
        make_directory_watcher(options_.server_logs, options_.watch_mode, options_.poll_interval),
        [this](const std::string& line) { handle_line(queue_, EventSource::ServerLog, line); });

    accounting_tailer_ = std::make_unique<DirectoryTailer>(
        "accounting",
        make_directory_watcher(options_.accounting_logs, options_.watch_mode, options_.poll_interval),
        [this](const std::string& line) { handle_line(queue_, EventSource::AccountingLog, line); });
}

LogCollector::~LogCollector() {
    stop();
}

void LogCollector::set_failure_handler(DirectoryTailer::FailureHandler handler) {
    server_tailer_->set_failure_handler(handler);
    accounting_tailer_->set_failure_handler(std::move(handler));
}

void LogCollector::handle_line(EventQueue& queue, EventSource source, const std::string& line) {
    if (line.empty()) return;
    try {
        queue.push(parse_line(source, line));
    } catch (const ParseError& e) {
        AppLog::warn("Parser", std::string(parse_error_kind_name(e.kind())) + ": " + e.what());
    }
}

size_t LogCollector::replay() {
    if (options_.replay_files == 0) {
        AppLog::info("Collector", "Replay disabled");
        return 0;
    }

    auto server = replay_directory(options_.server_logs, EventSource::ServerLog, options_.replay_files);
    auto accounting = replay_directory(options_.accounting_logs, EventSource::AccountingLog,
                                       options_.replay_files);

    hand_off(*server_tailer_, server);
    hand_off(*accounting_tailer_, accounting);

    std::vector<std::vector<Event>> sequences;
    sequences.push_back(std::move(server.events));
    sequences.push_back(std::move(accounting.events));
    auto merged = merge_by_timestamp(std::move(sequences));

    size_t count = merged.size();
    for (auto& event : merged) {
        queue_.push(std::move(event));
    }

    AppLog::info("Collector", "Replayed " + std::to_string(count) + " events (" +
                 std::to_string(server.skipped_lines + accounting.skipped_lines) + " lines skipped)");
    return count;
}

void LogCollector::hand_off(DirectoryTailer& tailer, const DirectoryReplay& replay) {
    auto resume = replay.resume();
    if (!resume) return;

    for (size_t i = 0; i + 1 < replay.files.size(); i++) {
        tailer.retire(replay.files[i].path, replay.files[i].consumed);
    }
    tailer.resume_from(resume->path, resume->consumed);
}

void LogCollector::start() {
    server_tailer_->start();
    accounting_tailer_->start();
}

void LogCollector::stop() {
    accounting_tailer_->stop();
    server_tailer_->stop();
}

} // namespace torque_notify
