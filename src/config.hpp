#pragma once

#include "directory_watcher.hpp"
#include "dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iosfwd>
#include <string>

namespace torque_notify {

constexpr const char* kDefaultTorqueHome = "/var/spool/torque";

struct Config {
    std::string torque_home;
    std::string server_logs;                  // Default: <torque_home>/server_logs
    std::string accounting_logs;              // Default: <torque_home>/server_priv/accounting

    std::string endpoint;                     // Webhook URL, required unless print_only
    std::string username;
    std::string channel;
    bool print_only = false;                  // Write events to stdout instead of posting

    double min_post_delay = 6.0;              // Seconds
    double failure_cooldown = 120.0;          // Seconds
    FailurePolicy failure_policy = FailurePolicy::Continue;

    size_t replay_files = 7;
    WatchMode watch_mode = WatchMode::Inotify;
    int poll_interval_ms = 200;

    bool show_help = false;

    DispatcherOptions dispatcher_options() const;
};

// $TORQUE_HOME if set, else /var/spool/torque
std::string default_torque_home();

// Command line options override values from --config regardless of order.
// Throws std::invalid_argument on unknown options or bad values.
Config parse_args(int argc, char* argv[]);

// Applies the keys of a JSON config object (same names as the long options, snake_case)
void apply_config_json(Config& config, const nlohmann::json& j);
void load_config_file(Config& config, const std::string& path);

// Fills derived paths and checks required values
void finalize_config(Config& config);

void print_usage(std::ostream& out, const char* program);

} // namespace torque_notify
