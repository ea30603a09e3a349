#pragma once

#include "NotificationSink.h"
#include <string>

namespace notify {

// POSTs each notification as JSON to an http:// endpoint. A non-2xx answer or any network error is a
// DeliveryError; every network step is bounded by the delivery timeout.
class WebhookSink : public NotificationSink {
public:
    // throws std::invalid_argument for anything but http://host[:port][/path]
    explicit WebhookSink(const std::string& url);
    void deliver(const Notification& n, std::chrono::milliseconds timeout) override;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& target() const { return target_; }

private:
    std::string host_;
    std::string port_;
    std::string target_;
};

}
