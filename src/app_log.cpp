#include "app_log.hpp"
#include <iostream>

namespace torque_notify {

AppLog::Sink AppLog::sink_ = AppLog::console_sink;
std::mutex AppLog::mutex_;

void AppLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void AppLog::info(const std::string& component, const std::string& message) {
    write(Level::Info, component, message);
}

void AppLog::warn(const std::string& component, const std::string& message) {
    write(Level::Warning, component, message);
}

void AppLog::error(const std::string& component, const std::string& message) {
    write(Level::Error, component, message);
}

void AppLog::write(Level level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, component, message);
    }
}

const char* AppLog::level_name(Level level) {
    switch (level) {
        case Level::Info: return "info";
        case Level::Warning: return "warning";
        case Level::Error: return "error";
        default: return "unknown";
    }
}

void AppLog::console_sink(Level level, const std::string& component,
                          const std::string& message) {
    if (level == Level::Info) {
        std::cout << "[" << component << "] " << message << std::endl;
    } else {
        std::cerr << "[" << component << "] " << level_name(level) << ": " << message << std::endl;
    }
}

} // namespace torque_notify
