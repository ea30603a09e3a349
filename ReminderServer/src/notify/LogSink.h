#pragma once

#include "NotificationSink.h"

namespace notify {

// Writes each notification to the structured log.
class LogSink : public NotificationSink {
public:
    void deliver(const Notification& n, std::chrono::milliseconds timeout) override;
};

}
