#include "config.hpp"
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace torque_notify {

namespace {

double parse_seconds(const std::string& option, const std::string& value) {
    size_t pos = 0;
    double seconds = 0;
    try {
        seconds = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (pos != value.size() || seconds < 0) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return seconds;
}

long parse_count(const std::string& option, const std::string& value) {
    size_t pos = 0;
    long count = 0;
    try {
        count = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (pos != value.size() || count < 0) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return count;
}

// Rescan interval in milliseconds; 0 would rescan without pausing
int parse_interval(const std::string& option, long long value) {
    if (value <= 0 || value > INT_MAX) {
        throw std::invalid_argument("Invalid value for " + option + ": " + std::to_string(value));
    }
    return static_cast<int>(value);
}

long long json_count(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("Invalid config value for " + key + ": expected an integer");
    }
    auto count = value.get<long long>();
    if (count < 0) {
        throw std::invalid_argument("Invalid config value for " + key + ": " + std::to_string(count));
    }
    return count;
}

FailurePolicy parse_policy(const std::string& value) {
    if (value == "continue") return FailurePolicy::Continue;
    if (value == "abort") return FailurePolicy::Abort;
    throw std::invalid_argument("Invalid failure policy: " + value + " (expected continue or abort)");
}

WatchMode parse_watch_mode(const std::string& value) {
    if (value == "inotify") return WatchMode::Inotify;
    if (value == "poll") return WatchMode::Poll;
    throw std::invalid_argument("Invalid watch mode: " + value + " (expected inotify or poll)");
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0 + 0.5));
}

} // namespace

DispatcherOptions Config::dispatcher_options() const {
    DispatcherOptions options;
    options.min_post_delay = to_millis(min_post_delay);
    options.failure_cooldown = to_millis(failure_cooldown);
    options.failure_policy = failure_policy;
    return options;
}

std::string default_torque_home() {
    const char* env = std::getenv("TORQUE_HOME");
    if (env && *env) return env;
    return kDefaultTorqueHome;
}

void apply_config_json(Config& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config file must contain a JSON object");
    }

    try {
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            const nlohmann::json& value = it.value();
            if (key == "torque_home") config.torque_home = value.get<std::string>();
            else if (key == "server_logs") config.server_logs = value.get<std::string>();
            else if (key == "accounting_logs") config.accounting_logs = value.get<std::string>();
            else if (key == "endpoint") config.endpoint = value.get<std::string>();
            else if (key == "username") config.username = value.get<std::string>();
            else if (key == "channel") config.channel = value.get<std::string>();
            else if (key == "print") config.print_only = value.get<bool>();
            else if (key == "min_post_delay") config.min_post_delay = value.get<double>();
            else if (key == "failure_cooldown") config.failure_cooldown = value.get<double>();
            else if (key == "on_failure") config.failure_policy = parse_policy(value.get<std::string>());
            else if (key == "replay_files") config.replay_files = static_cast<size_t>(json_count(key, value));
            else if (key == "watch") config.watch_mode = parse_watch_mode(value.get<std::string>());
            else if (key == "poll_interval") config.poll_interval_ms = parse_interval(key, json_count(key, value));
            else throw std::invalid_argument("Unknown config key: " + key);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }

    if (config.min_post_delay < 0 || config.failure_cooldown < 0) {
        throw std::invalid_argument("Config values must not be negative");
    }
}

void load_config_file(Config& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("Unable to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Failed to parse " + path + ": " + e.what());
    }
    apply_config_json(config, j);
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    // The config file is applied first so the command line can override it
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for --config");
            load_config_file(config, argv[i + 1]);
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        if (arg == "--print") {
            config.print_only = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Unknown option or missing value: " + arg);
        }
        std::string value = argv[i + 1];

        if (arg == "--config") {
            // Already loaded
        }
        else if (arg == "--torque-home") {
            config.torque_home = value;
        }
        else if (arg == "--server-logs") {
            config.server_logs = value;
        }
        else if (arg == "--accounting-logs") {
            config.accounting_logs = value;
        }
        else if (arg == "--endpoint") {
            config.endpoint = value;
        }
        else if (arg == "--username") {
            config.username = value;
        }
        else if (arg == "--channel") {
            config.channel = value;
        }
        else if (arg == "--min-post-delay") {
            config.min_post_delay = parse_seconds(arg, value);
        }
        else if (arg == "--failure-cooldown") {
            config.failure_cooldown = parse_seconds(arg, value);
        }
        else if (arg == "--on-failure") {
            config.failure_policy = parse_policy(value);
        }
        else if (arg == "--replay-files") {
            config.replay_files = static_cast<size_t>(parse_count(arg, value));
        }
        else if (arg == "--watch") {
            config.watch_mode = parse_watch_mode(value);
        }
        else if (arg == "--poll-interval") {
            config.poll_interval_ms = parse_interval(arg, parse_count(arg, value));
        }
        else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        i++;
    }

    finalize_config(config);
    return config;
}

void finalize_config(Config& config) {
    if (config.torque_home.empty()) {
        config.torque_home = default_torque_home();
    }

    std::filesystem::path home(config.torque_home);
    if (config.server_logs.empty()) {
        config.server_logs = (home / "server_logs").string();
    }
    if (config.accounting_logs.empty()) {
        config.accounting_logs = (home / "server_priv" / "accounting").string();
    }

    if (!config.print_only && config.endpoint.empty()) {
        throw std::invalid_argument("An --endpoint is required unless --print is given");
    }
}

void print_usage(std::ostream& out, const char* program) {
    out << "torque_notify - forward Torque server and accounting log events to a webhook\n\n";
    out << "Usage: " << program << " [options]\n\n";
    out << "Options:\n";
    out << "  --endpoint URL            Webhook URL receiving one JSON POST per event\n";
    out << "  --print                   Write events to stdout instead of posting\n";
    out << "  --torque-home PATH        Torque home (default: $TORQUE_HOME or " << kDefaultTorqueHome << ")\n";
    out << "  --server-logs PATH        Server log directory (default: <torque-home>/server_logs)\n";
    out << "  --accounting-logs PATH    Accounting log directory (default: <torque-home>/server_priv/accounting)\n";
    out << "  --min-post-delay SECONDS  Minimum delay between posts (default: 6)\n";
    out << "  --on-failure POLICY       continue or abort on delivery errors (default: continue)\n";
    out << "  --failure-cooldown SECONDS  Wait after a failed post with 'continue' (default: 120)\n";
    out << "  --replay-files N          Recent files replayed per directory at startup (default: 7)\n";
    out << "  --watch MODE              inotify or poll (default: inotify)\n";
    out << "  --poll-interval MS        Directory rescan interval with --watch poll (default: 200)\n";
    out << "  --username NAME           Sender name shown by the webhook\n";
    out << "  --channel NAME            Channel override for the webhook\n";
    out << "  --config PATH             JSON file with the same settings (snake_case keys)\n";
    out << "  --help                    Show this help message\n\n";
    out << "Example:\n";
    out << "  " << program << " --endpoint https://hooks.slack.com/services/T000/B000/XXXX\n";
}

} // namespace torque_notify
