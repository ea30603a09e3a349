#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>

namespace notify {

struct Notification {
    uint64_t event_id = 0;
    std::string owner_context;
    std::string payload;
    time_t scheduled_utc = 0;   // the occurrence itself
    int64_t lead_sec = 0;       // how long before scheduled_utc the notification was due
    uint32_t occurrence = 0;    // 1 for the first fire
};

class DeliveryError : public std::runtime_error {
public:
    explicit DeliveryError(const std::string& msg) : std::runtime_error(msg) {}
};

// Delivers a fired event. Must return or throw DeliveryError within `timeout`.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void deliver(const Notification& n, std::chrono::milliseconds timeout) = 0;
};

std::string to_json(const Notification& n);

}
