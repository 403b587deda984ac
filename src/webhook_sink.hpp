#pragma once

#include "event_sink.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace torque_notify {

struct MessageOptions {
    std::string username;                     // Empty: webhook default
    std::string channel;                      // Empty: webhook default
};

// Attachment colors understood by Slack-compatible webhooks
namespace attachment_color {
inline const char* const Good = "good";
inline const char* const Warning = "warning";
inline const char* const Danger = "danger";
}

// Upper bound for a server-requested Retry-After
constexpr std::chrono::seconds kMaxRetryAfter{24 * 3600};

// Escapes &, < and > so that log text is never read as markup
std::string escape_markup(const std::string& text);

// Q -> "queued", E -> "ended", ...; unknown codes are returned as-is
std::string accounting_state_name(const std::string& state);

// Webhook document for one event
nlohmann::json format_message(const Event& event, const MessageOptions& options = {});

struct Endpoint {
    std::string base;                         // scheme://host[:port]
    std::string path;                         // Starts with '/'
};

// Throws std::invalid_argument on anything but an absolute http(s) URL
Endpoint split_endpoint(const std::string& url);

// POSTs each event as application/json. 429 responses report Retry-After.
class WebhookSink : public EventSink {
public:
    explicit WebhookSink(const std::string& url, MessageOptions options = {},
                         std::chrono::seconds timeout = std::chrono::seconds(30));

    DeliveryResult deliver(const Event& event) override;

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Endpoint endpoint_;
    MessageOptions options_;
    httplib::Client client_;
};

} // namespace torque_notify
