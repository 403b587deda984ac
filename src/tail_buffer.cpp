#include "tail_buffer.hpp"

namespace torque_notify {

std::vector<std::string> TailBuffer::feed(const std::string& data) {
    std::vector<std::string> lines;

    size_t last = data.rfind('\n');
    if (last == std::string::npos) {
        pending_ += data;
        return lines;
    }

    std::string complete = pending_;
    complete.append(data, 0, last);
    pending_.assign(data, last + 1, std::string::npos);

    size_t start = 0;
    while (true) {
        size_t pos = complete.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(complete.substr(start));
            break;
        }
        lines.push_back(complete.substr(start, pos - start));
        start = pos + 1;
    }

    return lines;
}

} // namespace torque_notify
