#include <catch2/catch_test_macros.hpp>
#include "line_parser.hpp"

using namespace torque_notify;

TEST_CASE("Server log lines", "[parser][server]") {
    SECTION("Job enqueue line") {
        auto event = parse_server_line(
            "02/27/2015 00:59:44;0100;PBS_Server.23657;Job;22495[].clusterhn.cluster.com;"
            "enqueuing into default, state 1 hop 1");

        REQUIRE(event.source == EventSource::ServerLog);
        REQUIRE(event.timestamp.year == 2015);
        REQUIRE(event.timestamp.month == 2);
        REQUIRE(event.timestamp.day == 27);
        REQUIRE(event.timestamp.hour == 0);
        REQUIRE(event.timestamp.minute == 59);
        REQUIRE(event.timestamp.second == 44);
        REQUIRE(event.log_type == "0100");
        REQUIRE(event.server == "PBS_Server.23657");
        REQUIRE(event.section == "Job");
        REQUIRE(event.about == "22495[].clusterhn.cluster.com");
        REQUIRE(event.message == "enqueuing into default, state 1 hop 1");
    }

    SECTION("Message keeps embedded separators") {
        auto event = parse_server_line(
            "03/01/2015 12:00:01;0008;PBS_Server.1;Job;1.host;Job Modified at request of a;b;c");
        REQUIRE(event.about == "1.host");
        REQUIRE(event.message == "Job Modified at request of a;b;c");
    }

    SECTION("Empty message field is allowed") {
        auto event = parse_server_line("03/01/2015 12:00:01;0002;PBS_Server.1;Svr;PBS_Server;");
        REQUIRE(event.about == "PBS_Server");
        REQUIRE(event.message.empty());
    }

    SECTION("Too few fields") {
        try {
            parse_server_line("02/27/2015 00:59:44;0100;PBS_Server.23657;Job");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.kind() == ParseErrorKind::MalformedServerLine);
        }
    }
}

TEST_CASE("Accounting log lines", "[parser][accounting]") {
    SECTION("Queued job") {
        auto event = parse_accounting_line(
            "02/26/2015 00:04:48;Q;22320.clusterhn.cluster.com;queue=default");

        REQUIRE(event.source == EventSource::AccountingLog);
        REQUIRE(event.timestamp.to_string() == "2015-02-26T00:04:48");
        REQUIRE(event.state == "Q");
        REQUIRE(event.job_id == "22320.clusterhn.cluster.com");
        REQUIRE(event.properties.size() == 1);
        REQUIRE(event.properties.at("queue") == "default");
    }

    SECTION("Several properties, values containing '='") {
        auto event = parse_accounting_line(
            "02/26/2015 10:14:02;E;22321.host;user=alice group=users "
            "jobname=run=3 Exit_status=0 resources_used.walltime=00:10:02");

        REQUIRE(event.properties.size() == 5);
        REQUIRE(event.properties.at("user") == "alice");
        REQUIRE(event.properties.at("group") == "users");
        REQUIRE(event.properties.at("jobname") == "run=3");
        REQUIRE(event.properties.at("Exit_status") == "0");
        REQUIRE(event.properties.at("resources_used.walltime") == "00:10:02");
    }

    SECTION("Empty properties") {
        auto event = parse_accounting_line("02/26/2015 00:04:48;D;22320.host;");
        REQUIRE(event.state == "D");
        REQUIRE(event.properties.empty());
    }

    SECTION("Trailing whitespace and repeated spaces are ignored") {
        auto event = parse_accounting_line("02/26/2015 00:04:48;S;1.host;user=bob  queue=batch \r");
        REQUIRE(event.properties.size() == 2);
        REQUIRE(event.properties.at("queue") == "batch");
    }

    SECTION("Property without '='") {
        try {
            parse_accounting_line("02/26/2015 00:04:48;Q;1.host;queue=default bogus");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.kind() == ParseErrorKind::MalformedAccountingLine);
        }
    }

    SECTION("Too few fields") {
        try {
            parse_accounting_line("02/26/2015 00:04:48;Q");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.kind() == ParseErrorKind::MalformedAccountingLine);
        }
    }
}

TEST_CASE("Timestamp prefix", "[parser][timestamp]") {
    auto kind_of = [](const std::string& line) {
        try {
            parse_server_line(line);
        } catch (const ParseError& e) {
            return e.kind();
        }
        FAIL("expected ParseError for " << line);
        return ParseErrorKind::MalformedServerLine;
    };

    REQUIRE(kind_of("") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("2/27/2015 00:59:44;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("02/27/15 00:59:44;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("02/27/2015 0:59:44;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("02/27/2015 00:59:44 0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("02-27-2015 00:59:44;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("0a/27/2015 00:59:44;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);

    // Well formed but impossible
    REQUIRE(kind_of("13/01/2015 00:00:00;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("02/29/2015 00:00:00;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);
    REQUIRE(kind_of("01/01/2015 24:00:00;0100;a;b;c;d") == ParseErrorKind::MalformedTimestamp);

    std::string rest;
    auto leap = parse_log_timestamp("02/29/2016 23:59:59;tail", rest);
    REQUIRE(leap.day == 29);
    REQUIRE(rest == "tail");
}

TEST_CASE("Timestamp ordering", "[parser][timestamp]") {
    std::string rest;
    auto a = parse_log_timestamp("12/31/2014 23:59:59;", rest);
    auto b = parse_log_timestamp("01/01/2015 00:00:00;", rest);
    auto c = parse_log_timestamp("01/01/2015 00:00:00;", rest);

    REQUIRE(a < b);
    REQUIRE(b > a);
    REQUIRE(b == c);
    REQUIRE(b <= c);
    REQUIRE_FALSE(b < c);
}

TEST_CASE("parse_line dispatches on source", "[parser]") {
    auto acct = parse_line(EventSource::AccountingLog, "02/26/2015 00:04:48;Q;1.host;queue=default");
    REQUIRE(acct.source == EventSource::AccountingLog);

    auto srv = parse_line(EventSource::ServerLog, "02/26/2015 00:04:48;0100;s;Job;1.host;msg");
    REQUIRE(srv.source == EventSource::ServerLog);
}

TEST_CASE("split_limited caps the number of parts", "[parser]") {
    REQUIRE(split_limited("a;b;c;d", ';', 3) == std::vector<std::string>{"a", "b", "c;d"});
    REQUIRE(split_limited("a;b", ';', 3) == std::vector<std::string>{"a", "b"});
    REQUIRE(split_limited("", ';', 3) == std::vector<std::string>{""});
    REQUIRE(split_limited(";;", ';', 5) == std::vector<std::string>{"", "", ""});
}

TEST_CASE("Event JSON", "[event]") {
    auto srv = parse_server_line("02/27/2015 00:59:44;0100;PBS_Server.23657;Job;22495.host;hello");
    auto j = srv.to_json();
    REQUIRE(j["log"] == "server");
    REQUIRE(j["timestamp"] == "2015-02-27T00:59:44");
    REQUIRE(j["type"] == "0100");
    REQUIRE(j["about"] == "22495.host");
    REQUIRE_FALSE(j.contains("job_id"));

    auto acct = parse_accounting_line("02/26/2015 00:04:48;Q;22320.host;queue=default");
    auto k = acct.to_json();
    REQUIRE(k["log"] == "accounting");
    REQUIRE(k["job_id"] == "22320.host");
    REQUIRE(k["state"] == "Q");
    REQUIRE(k["properties"]["queue"] == "default");
    REQUIRE_FALSE(k.contains("message"));
}
