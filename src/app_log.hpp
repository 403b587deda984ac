#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace torque_notify {

// Process-wide log sink shared by the tailers, the replay and the dispatcher
class AppLog {
public:
    enum class Level { Info, Warning, Error };

    using Sink = std::function<void(Level level,
                                    const std::string& component,
                                    const std::string& message)>;

    // An empty sink restores the console sink
    static void set_sink(Sink sink);

    static void info(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Writes info to cout, warnings and errors to cerr
    static void console_sink(Level level, const std::string& component,
                             const std::string& message);

    static const char* level_name(Level level);

private:
    static void write(Level level, const std::string& component, const std::string& message);

    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace torque_notify
