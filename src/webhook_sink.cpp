#include "webhook_sink.hpp"
#include "app_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace torque_notify {

std::string escape_markup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string accounting_state_name(const std::string& state) {
    if (state == "Q") return "queued";
    if (state == "S") return "started";
    if (state == "E") return "ended";
    if (state == "D") return "deleted";
    if (state == "A") return "aborted";
    if (state == "R") return "rerun";
    if (state == "C") return "checkpointed";
    if (state == "T") return "restarted";
    return state;
}

namespace {

nlohmann::json server_attachment(const Event& event) {
    std::string title = event.section + " " + event.about;
    nlohmann::json a;
    a["fallback"] = title + ": " + event.message;
    a["title"] = escape_markup(title);
    a["text"] = escape_markup(event.message);
    return a;
}

nlohmann::json accounting_attachment(const Event& event) {
    std::string summary = "Job " + event.job_id + " " + accounting_state_name(event.state);

    auto name = event.properties.find("jobname");
    std::string title = name != event.properties.end() ? name->second : event.job_id;

    std::string text;
    for (const auto& [key, value] : event.properties) {
        if (!text.empty()) text += "\n";
        text += key + ": " + value;
    }

    nlohmann::json a;
    a["fallback"] = summary;
    a["title"] = escape_markup(title);
    a["text"] = escape_markup(text);

    if (event.state == "E") {
        auto status = event.properties.find("Exit_status");
        if (status != event.properties.end()) {
            a["color"] = status->second == "0" ? attachment_color::Good : attachment_color::Danger;
        }
    } else if (event.state == "D" || event.state == "A") {
        a["color"] = attachment_color::Warning;
    }
    return a;
}

// Seconds form only; anything else (HTTP-date, trailing text) counts as 0
std::chrono::seconds parse_retry_after(const std::string& header) {
    if (header.empty()) return std::chrono::seconds(0);

    long seconds = 0;
    try {
        size_t pos = 0;
        seconds = std::stol(header, &pos);
        if (pos != header.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::out_of_range&) {
        seconds = header[0] == '-' ? 0 : static_cast<long>(kMaxRetryAfter.count());
    } catch (const std::invalid_argument&) {
        AppLog::warn("Webhook", "Ignoring malformed Retry-After: " + header);
        seconds = 0;
    }
    return std::chrono::seconds(std::clamp<long>(seconds, 0, static_cast<long>(kMaxRetryAfter.count())));
}

} // namespace

nlohmann::json format_message(const Event& event, const MessageOptions& options) {
    nlohmann::json doc;
    if (event.source == EventSource::ServerLog) {
        doc["text"] = escape_markup(event.server + " [" + event.timestamp.to_string() + "]");
        doc["attachments"] = nlohmann::json::array({server_attachment(event)});
    } else {
        doc["text"] = escape_markup("Job " + event.job_id + " " + accounting_state_name(event.state) +
                                    " [" + event.timestamp.to_string() + "]");
        doc["attachments"] = nlohmann::json::array({accounting_attachment(event)});
    }
    if (!options.username.empty()) doc["username"] = options.username;
    if (!options.channel.empty()) doc["channel"] = options.channel;
    return doc;
}

Endpoint split_endpoint(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Endpoint is not an absolute URL: " + url);
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Unsupported endpoint scheme: " + scheme);
    }

    auto path_start = url.find('/', scheme_end + 3);
    Endpoint endpoint;
    endpoint.base = url.substr(0, path_start);
    endpoint.path = path_start == std::string::npos ? "/" : url.substr(path_start);

    if (endpoint.base.size() == scheme_end + 3) {
        throw std::invalid_argument("Endpoint has no host: " + url);
    }
    return endpoint;
}

WebhookSink::WebhookSink(const std::string& url, MessageOptions options, std::chrono::seconds timeout)
    : endpoint_(split_endpoint(url))
    , options_(std::move(options))
    , client_(endpoint_.base)
{
    client_.set_connection_timeout(timeout);
    client_.set_read_timeout(timeout);
    client_.set_write_timeout(timeout);
}

DeliveryResult WebhookSink::deliver(const Event& event) {
    std::string body = format_message(event, options_)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    AppLog::info("Webhook", "Posting message " + body);

    auto res = client_.Post(endpoint_.path, body, "application/json");
    if (!res) {
        return DeliveryResult::failed("POST " + endpoint_.base + endpoint_.path + " failed: " +
                                      httplib::to_string(res.error()));
    }

    if (res->status >= 200 && res->status < 300) {
        return DeliveryResult::delivered();
    }

    if (res->status == 429) {
        return DeliveryResult::rate_limited(parse_retry_after(res->get_header_value("Retry-After")));
    }

    return DeliveryResult::failed("POST " + endpoint_.base + endpoint_.path + " returned " +
                                  std::to_string(res->status) + ": " + res->body);
}

} // namespace torque_notify
