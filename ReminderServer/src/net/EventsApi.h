#pragma once

#include "Router.h"
#include <functional>
#include <string>

namespace engine { class EventRegistry; class FireQueue; }

// JSON command surface over the registry: /health, /metrics and /events.
class EventsApi {
public:
    EventsApi(engine::EventRegistry& registry, engine::FireQueue& queue, std::function<std::string()> scheduler_state);

    void install(Router& router, bool metrics_enabled);

    Response health(const Request& req) const;
    Response create(const Request& req);
    Response list(const Request& req) const;
    Response get(const Request& req) const;
    Response modify(const Request& req);
    Response cancel(const Request& req);

private:
    engine::EventRegistry& registry_;
    engine::FireQueue& queue_;
    std::function<std::string()> scheduler_state_;
};
