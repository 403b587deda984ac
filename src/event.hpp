#pragma once

#include <string>
#include <map>
#include <tuple>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace torque_notify {

// Which Torque log directory a line came from
enum class EventSource : int {
    ServerLog = 0,
    AccountingLog = 1
};

inline std::string source_to_string(EventSource s) {
    switch (s) {
        case EventSource::ServerLog: return "server";
        case EventSource::AccountingLog: return "accounting";
        default: return "unknown";
    }
}

// Wall clock time as written by pbs_server: local time, second precision, no zone
struct Timestamp {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    std::string to_string() const {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                      year, month, day, hour, minute, second);
        return buf;
    }

    auto key() const { return std::tie(year, month, day, hour, minute, second); }
};

inline bool operator<(const Timestamp& a, const Timestamp& b) { return a.key() < b.key(); }
inline bool operator>(const Timestamp& a, const Timestamp& b) { return b < a; }
inline bool operator<=(const Timestamp& a, const Timestamp& b) { return !(b < a); }
inline bool operator>=(const Timestamp& a, const Timestamp& b) { return !(a < b); }
inline bool operator==(const Timestamp& a, const Timestamp& b) { return a.key() == b.key(); }
inline bool operator!=(const Timestamp& a, const Timestamp& b) { return !(a == b); }

// One parsed log line. Only the fields of its source are populated.
struct Event {
    Timestamp timestamp;
    EventSource source = EventSource::ServerLog;

    // ServerLog
    std::string log_type;                     // Numeric event class, e.g. "0100"
    std::string server;                       // e.g. "PBS_Server.23657"
    std::string section;                      // e.g. "Job", "Svr", "Req"
    std::string about;                        // Object the line is about
    std::string message;

    // AccountingLog
    std::string job_id;
    std::string state;                        // Single letter record type (Q, S, E, ...)
    std::map<std::string, std::string> properties;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["log"] = source_to_string(source);
        j["timestamp"] = timestamp.to_string();
        if (source == EventSource::ServerLog) {
            j["type"] = log_type;
            j["server"] = server;
            j["section"] = section;
            j["about"] = about;
            j["message"] = message;
        } else {
            j["job_id"] = job_id;
            j["state"] = state;
            j["properties"] = properties;
        }
        return j;
    }
};

} // namespace torque_notify
