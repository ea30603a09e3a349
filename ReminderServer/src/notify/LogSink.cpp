#include "LogSink.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../recurrence/TimeResolver.h"
#include <sstream>

namespace notify {

std::string to_json(const Notification& n) {
    std::ostringstream ss;
    ss << "{\"event_id\":" << n.event_id
       << ",\"owner_context\":" << json_quote(n.owner_context)
       << ",\"payload\":" << json_quote(n.payload)
       << ",\"scheduled_utc\":" << json_quote(recurrence::format_iso_z(n.scheduled_utc))
       << ",\"lead_sec\":" << n.lead_sec
       << ",\"occurrence\":" << n.occurrence << '}';
    return ss.str();
}

void LogSink::deliver(const Notification& n, std::chrono::milliseconds) {
    observability::log_info("notification.delivered", {
        {"event_id", int64_t(n.event_id)},
        {"owner_context", n.owner_context},
        {"payload", n.payload},
        {"scheduled_utc", recurrence::format_iso_z(n.scheduled_utc)},
        {"lead_sec", n.lead_sec},
        {"occurrence", int64_t(n.occurrence)}});
}

}
