#pragma once

#include "event.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace torque_notify {

enum class ParseErrorKind {
    MalformedTimestamp,
    MalformedServerLine,
    MalformedAccountingLine
};

const char* parse_error_kind_name(ParseErrorKind kind);

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

// Parses the "MM/DD/YYYY HH:MM:SS;" prefix and returns the rest of the line in `rest`
Timestamp parse_log_timestamp(const std::string& line, std::string& rest);

// 02/27/2015 00:59:44;0100;PBS_Server.23657;Job;22495[].clusterhn.cluster.com;enqueuing into default, state 1 hop 1
Event parse_server_line(const std::string& line);

// 02/26/2015 00:04:48;Q;22320.clusterhn.cluster.com;queue=default
Event parse_accounting_line(const std::string& line);

// Dispatches on the source directory format
Event parse_line(EventSource source, const std::string& line);

// Splits on `sep` into at most `max_parts` parts; the last part keeps any remaining separators
std::vector<std::string> split_limited(const std::string& s, char sep, size_t max_parts);

} // namespace torque_notify
