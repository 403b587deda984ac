#include "event_sink.hpp"

namespace torque_notify {

DeliveryResult ConsoleSink::deliver(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << std::endl;
    return DeliveryResult::delivered();
}

} // namespace torque_notify
