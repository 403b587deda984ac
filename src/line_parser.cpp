#include "line_parser.hpp"
#include <cctype>

namespace torque_notify {

namespace {

constexpr size_t kTimestampPrefixLength = 20;  // "MM/DD/YYYY HH:MM:SS;"

bool read_digits(const std::string& s, size_t pos, size_t count, int& value) {
    value = 0;
    for (size_t i = pos; i < pos + count; i++) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

std::string trim_right(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

} // namespace

const char* parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MalformedTimestamp: return "MalformedTimestamp";
        case ParseErrorKind::MalformedServerLine: return "MalformedServerLine";
        case ParseErrorKind::MalformedAccountingLine: return "MalformedAccountingLine";
        default: return "Unknown";
    }
}

std::vector<std::string> split_limited(const std::string& s, char sep, size_t max_parts) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (parts.size() + 1 < max_parts) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) break;
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

Timestamp parse_log_timestamp(const std::string& line, std::string& rest) {
    // Layout: MM/DD/YYYY HH:MM:SS;
    //         0123456789012345678 9
    if (line.size() < kTimestampPrefixLength ||
        line[2] != '/' || line[5] != '/' || line[10] != ' ' ||
        line[13] != ':' || line[16] != ':' || line[19] != ';') {
        throw ParseError(ParseErrorKind::MalformedTimestamp,
                         "Unable to match date on log message: " + line);
    }

    Timestamp ts;
    bool ok = read_digits(line, 0, 2, ts.month)
           && read_digits(line, 3, 2, ts.day)
           && read_digits(line, 6, 4, ts.year)
           && read_digits(line, 11, 2, ts.hour)
           && read_digits(line, 14, 2, ts.minute)
           && read_digits(line, 17, 2, ts.second);
    if (!ok) {
        throw ParseError(ParseErrorKind::MalformedTimestamp,
                         "Unable to match date on log message: " + line);
    }

    if (ts.year < 1 || ts.month < 1 || ts.month > 12 ||
        ts.day < 1 || ts.day > days_in_month(ts.year, ts.month) ||
        ts.hour > 23 || ts.minute > 59 || ts.second > 59) {
        throw ParseError(ParseErrorKind::MalformedTimestamp,
                         "Invalid date on log message: " + line);
    }

    rest = line.substr(kTimestampPrefixLength);
    return ts;
}

Event parse_server_line(const std::string& line) {
    std::string body;
    Event event;
    event.timestamp = parse_log_timestamp(line, body);
    event.source = EventSource::ServerLog;

    auto fields = split_limited(body, ';', 5);
    if (fields.size() < 5) {
        throw ParseError(ParseErrorKind::MalformedServerLine,
                         "Expected 5 fields in server log line: " + line);
    }

    event.log_type = fields[0];
    event.server = fields[1];
    event.section = fields[2];
    event.about = fields[3];
    event.message = fields[4];
    return event;
}

Event parse_accounting_line(const std::string& line) {
    std::string body;
    Event event;
    event.timestamp = parse_log_timestamp(line, body);
    event.source = EventSource::AccountingLog;

    auto fields = split_limited(body, ';', 3);
    if (fields.size() < 3) {
        throw ParseError(ParseErrorKind::MalformedAccountingLine,
                         "Expected 3 fields in accounting log line: " + line);
    }

    event.state = fields[0];
    event.job_id = fields[1];

    // Space separated key=value pairs; values may themselves contain '='
    std::string properties = trim_right(fields[2]);
    size_t start = 0;
    while (start <= properties.size()) {
        size_t end = properties.find(' ', start);
        if (end == std::string::npos) end = properties.size();
        std::string token = properties.substr(start, end - start);
        start = end + 1;

        if (token.empty()) continue;

        size_t eq = token.find('=');
        if (eq == std::string::npos) {
            throw ParseError(ParseErrorKind::MalformedAccountingLine,
                             "Property without '=' (" + token + ") in accounting log line: " + line);
        }
        event.properties[token.substr(0, eq)] = token.substr(eq + 1);
    }

    return event;
}

Event parse_line(EventSource source, const std::string& line) {
    if (source == EventSource::AccountingLog) {
        return parse_accounting_line(line);
    }
    return parse_server_line(line);
}

} // namespace torque_notify
