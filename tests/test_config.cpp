#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <sstream>

using namespace torque_notify;
using test_support::TempDir;
using test_support::write_file;

namespace {

Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "torque_notify");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("Config defaults", "[config]") {
    unsetenv("TORQUE_HOME");
    auto config = parse({"--endpoint", "https://hooks.example.com/x"});

    REQUIRE(config.torque_home == "/var/spool/torque");
    REQUIRE(config.server_logs == "/var/spool/torque/server_logs");
    REQUIRE(config.accounting_logs == "/var/spool/torque/server_priv/accounting");
    REQUIRE(config.replay_files == 7);
    REQUIRE(config.watch_mode == WatchMode::Inotify);
    REQUIRE(config.failure_policy == FailurePolicy::Continue);

    auto options = config.dispatcher_options();
    REQUIRE(options.min_post_delay == std::chrono::seconds(6));
    REQUIRE(options.failure_cooldown == std::chrono::seconds(120));
}

TEST_CASE("TORQUE_HOME environment variable", "[config]") {
    setenv("TORQUE_HOME", "/opt/torque", 1);
    auto config = parse({"--print"});
    unsetenv("TORQUE_HOME");

    REQUIRE(config.print_only);
    REQUIRE(config.server_logs == "/opt/torque/server_logs");

    auto explicit_home = parse({"--print", "--torque-home", "/srv/pbs"});
    REQUIRE(explicit_home.accounting_logs == "/srv/pbs/server_priv/accounting");
}

TEST_CASE("Command line options", "[config]") {
    auto config = parse({"--endpoint", "http://localhost/hook",
                         "--server-logs", "/logs/server",
                         "--accounting-logs", "/logs/acct",
                         "--min-post-delay", "1.5",
                         "--failure-cooldown", "30",
                         "--on-failure", "abort",
                         "--replay-files", "3",
                         "--watch", "poll",
                         "--poll-interval", "500",
                         "--username", "torque",
                         "--channel", "#hpc"});

    REQUIRE(config.server_logs == "/logs/server");
    REQUIRE(config.accounting_logs == "/logs/acct");
    REQUIRE(config.replay_files == 3);
    REQUIRE(config.watch_mode == WatchMode::Poll);
    REQUIRE(config.poll_interval_ms == 500);
    REQUIRE(config.username == "torque");
    REQUIRE(config.channel == "#hpc");

    auto options = config.dispatcher_options();
    REQUIRE(options.min_post_delay == std::chrono::milliseconds(1500));
    REQUIRE(options.failure_cooldown == std::chrono::seconds(30));
    REQUIRE(options.failure_policy == FailurePolicy::Abort);
}

TEST_CASE("Invalid command lines", "[config]") {
    REQUIRE_THROWS_AS(parse({}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--bogus", "x"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--replay-files"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--replay-files", "-1"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--min-post-delay", "6s"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--on-failure", "retry"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--watch", "fanotify"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--print", "--poll-interval", "0"}), std::invalid_argument);

    REQUIRE(parse({"--help"}).show_help);
}

TEST_CASE("JSON config file", "[config]") {
    TempDir dir;
    auto path = dir.file("torque_notify.json");

    SECTION("Values from the file, overridden by the command line") {
        write_file(path, R"({
            "endpoint": "https://hooks.example.com/file",
            "torque_home": "/srv/torque",
            "min_post_delay": 10,
            "replay_files": 2,
            "on_failure": "abort"
        })");

        auto config = parse({"--replay-files", "4", "--config", path});
        REQUIRE(config.endpoint == "https://hooks.example.com/file");
        REQUIRE(config.server_logs == "/srv/torque/server_logs");
        REQUIRE(config.min_post_delay == 10.0);
        REQUIRE(config.failure_policy == FailurePolicy::Abort);
        REQUIRE(config.replay_files == 4);
    }

    SECTION("Unknown keys are rejected") {
        write_file(path, R"({"print": true, "endpont": "x"})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);
    }

    SECTION("Wrong value types are rejected") {
        write_file(path, R"({"print": true, "replay_files": "seven"})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);

        write_file(path, R"({"print": true, "replay_files": -1})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);

        write_file(path, R"({"print": true, "replay_files": 2.5})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);

        write_file(path, R"({"print": true, "poll_interval": 0})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);

        write_file(path, R"({"print": true, "poll_interval": -200})");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);
    }

    SECTION("Malformed JSON") {
        write_file(path, "{ endpoint: ");
        REQUIRE_THROWS_AS(parse({"--config", path}), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse({"--config", dir.file("absent.json")}), std::invalid_argument);
    }
}

TEST_CASE("Usage text", "[config]") {
    std::ostringstream out;
    print_usage(out, "torque_notify");
    REQUIRE(out.str().find("--endpoint") != std::string::npos);
    REQUIRE(out.str().find("--replay-files") != std::string::npos);
}
