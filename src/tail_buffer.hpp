#pragma once

#include <string>
#include <vector>

namespace torque_notify {

// Holds the unterminated tail of a file between reads
class TailBuffer {
public:
    // Appends `data` and returns every line completed by it, terminators stripped
    std::vector<std::string> feed(const std::string& data);

    // Drops the pending fragment (rotation or truncation)
    void reset() { pending_.clear(); }

    const std::string& pending() const { return pending_; }

private:
    std::string pending_;
};

} // namespace torque_notify
