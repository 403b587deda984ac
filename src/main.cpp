#include "app_log.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "event_queue.hpp"
#include "event_sink.hpp"
#include "log_collector.hpp"
#include "webhook_sink.hpp"

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace torque_notify;

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (config.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    // In --print mode stdout carries events only
    if (config.print_only) {
        AppLog::set_sink([](AppLog::Level level, const std::string& component, const std::string& message) {
            std::cerr << "[" << component << "] ";
            if (level != AppLog::Level::Info) std::cerr << AppLog::level_name(level) << ": ";
            std::cerr << message << std::endl;
        });
    }

    int exit_code = 0;

    try {
        asio::io_context io;

        // Fatal failures arrive on tailer or dispatcher threads
        auto fail = [&io, &exit_code](const std::string& reason) {
            asio::post(io, [&io, &exit_code, reason]() {
                AppLog::error("Main", "Shutting down: " + reason);
                exit_code = 1;
                io.stop();
            });
        };

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const asio::error_code& error, int signal_number) {
            if (!error) {
                AppLog::info("Main", "Received signal " + std::to_string(signal_number) + ", shutting down");
            }
            io.stop();
        });

        std::unique_ptr<EventSink> sink;
        if (config.print_only) {
            sink = std::make_unique<ConsoleSink>(std::cout);
        } else {
            MessageOptions message_options;
            message_options.username = config.username;
            message_options.channel = config.channel;
            sink = std::make_unique<WebhookSink>(config.endpoint, message_options);
            AppLog::info("Main", "Posting to " + config.endpoint);
        }

        EventQueue queue;

        CollectorOptions collector_options;
        collector_options.server_logs = config.server_logs;
        collector_options.accounting_logs = config.accounting_logs;
        collector_options.replay_files = config.replay_files;
        collector_options.watch_mode = config.watch_mode;
        collector_options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);

        LogCollector collector(queue, collector_options);
        collector.set_failure_handler([&fail](const std::string& name, const TailerError& error) {
            fail(name + " tailer: " + error.what());
        });

        Dispatcher dispatcher(queue, *sink, config.dispatcher_options());
        dispatcher.set_failure_handler([&fail](const DeliveryError& error) {
            fail(std::string("dispatcher: ") + error.what());
        });

        // History first, then live lines, so the queue holds them in that order
        collector.replay();
        dispatcher.start();
        collector.start();

        io.run();

        AppLog::info("Main", "Stopping services...");
        collector.stop();
        dispatcher.stop();

        auto stats = dispatcher.stats();
        AppLog::info("Main", "Shutdown complete. Delivered " + std::to_string(stats.delivered) +
                     ", rate limited " + std::to_string(stats.rate_limited) +
                     ", failed " + std::to_string(stats.failed));

    } catch (const std::exception& e) {
        AppLog::error("Main", std::string("Fatal error: ") + e.what());
        return 1;
    }

    return exit_code;
}
