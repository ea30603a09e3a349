#include "EventsApi.h"
#include "MiniJson.h"
#include "../engine/EventRegistry.h"
#include "../engine/FireQueue.h"
#include "../model/EventRecord.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../recurrence/TimeResolver.h"
#include "../store/PersistentStore.h"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace http = boost::beast::http;

namespace {

const std::string kEventsPrefix = "/events/";

Response error_response(http::status st, const Request& req, const std::string& code, const std::string& message) {
    return make_json_response(st, req, "{\"error\":" + json_quote(code) + ",\"message\":" + json_quote(message) + "}");
}

http::status status_code(engine::Status s) {
    switch (s) {
        case engine::Status::Ok: return http::status::ok;
        case engine::Status::NotFound: return http::status::not_found;
        case engine::Status::ValidationError:
        case engine::Status::InvalidTimezone:
        case engine::Status::InvalidRecurrence: return http::status::bad_request;
        case engine::Status::VersionConflict: return http::status::conflict;
    }
    return http::status::internal_server_error;
}

std::string record_json(const model::EventRecord& rec) {
    std::string js = model::to_json(rec);
    js.pop_back();
    js += ",\"next_fire\":" + json_quote(recurrence::format_iso_z(rec.next_fire_utc));
    if (auto w = std::get_if<model::Weekly>(&rec.recurrence)) js += ",\"weekdays_text\":" + json_quote(model::format_weekdays(w->days));
    js += "}";
    return js;
}

Response mutation_response(const engine::MutationResult& r, const Request& req, http::status ok_status) {
    if (!r.ok()) return error_response(status_code(r.status), req, engine::status_name(r.status), r.message);
    return make_json_response(ok_status, req, record_json(*r.record));
}

bool looks_like_object(const std::string& body) {
    size_t i = 0;
    while (i < body.size() && isspace((unsigned char)body[i])) ++i;
    return i < body.size() && body[i] == '{';
}

std::optional<uint64_t> id_from_path(const Request& req) {
    std::string path = request_path(req);
    if (path.size() <= kEventsPrefix.size()) return std::nullopt;
    auto v = parse_int64_strict_sv(std::string_view(path).substr(kEventsPrefix.size()));
    if (!v.has_value() || *v <= 0) return std::nullopt;
    return uint64_t(*v);
}

// Builds the recurrence named in the body; `fallback_kind` is used when the body names none.
std::optional<model::Recurrence> recurrence_from_body(const std::string& body, const std::string& fallback_kind, std::string& err) {
    auto kind = json_extract_string_opt_present(body, "recurrence");
    std::string k = kind.first && kind.second ? *kind.second : fallback_kind;
    uint8_t days = 0;
    auto wd = json_extract_string_opt_present(body, "weekdays");
    if (wd.first && wd.second) {
        auto parsed = model::parse_weekdays(*wd.second);
        if (!parsed) { err = "weekdays must be a list like \"mon,wed,fri\""; return std::nullopt; }
        days = *parsed;
    }
    int64_t interval = json_extract_int_opt(body, "interval_sec").value_or(0);
    auto rec = model::make_recurrence(k, days, interval);
    if (!rec) err = "recurrence must be one of none, daily, weekly, custom";
    return rec;
}

}

EventsApi::EventsApi(engine::EventRegistry& registry, engine::FireQueue& queue, std::function<std::string()> scheduler_state)
    : registry_(registry), queue_(queue), scheduler_state_(std::move(scheduler_state)) {}

void EventsApi::install(Router& router, bool metrics_enabled) {
    router.add_route("GET", "/health", [this](const Request& req) { return health(req); });
    if (metrics_enabled) {
        router.add_route("GET", "/metrics", [](const Request& req) {
            Response res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/plain; version=0.0.4");
            res.keep_alive(req.keep_alive());
            res.body() = observability::Metrics::instance().scrape();
            res.prepare_payload();
            return res;
        });
    }
    router.add_route("POST", "/events", [this](const Request& req) { return create(req); });
    router.add_route("GET", "/events", [this](const Request& req) { return list(req); });
    router.add_prefix_route("GET", kEventsPrefix, [this](const Request& req) { return get(req); });
    router.add_prefix_route("PATCH", kEventsPrefix, [this](const Request& req) { return modify(req); });
    router.add_prefix_route("DELETE", kEventsPrefix, [this](const Request& req) { return cancel(req); });
}

Response EventsApi::health(const Request& req) const {
    std::ostringstream ss;
    ss << "{\"status\":\"ok\",\"scheduler\":" << json_quote(scheduler_state_ ? scheduler_state_() : std::string("disabled"))
       << ",\"queue_depth\":" << queue_.size() << ",\"events\":" << registry_.size() << "}";
    return make_json_response(http::status::ok, req, ss.str());
}

Response EventsApi::create(const Request& req) {
    const std::string& body = req.body();
    if (!looks_like_object(body)) return error_response(http::status::bad_request, req, "validation_error", "body must be a JSON object");
    engine::EventSpec spec;
    try {
        spec.owner_context = json_extract_string(body, "owner_context");
        auto date = json_extract_string_opt_present(body, "date");
        auto lt = model::parse_local_time(json_extract_string(body, "time"), date.second.value_or(std::string()));
        if (!lt) return error_response(http::status::bad_request, req, "validation_error", "time must be HH:MM[:SS] and date YYYY-MM-DD");
        spec.local_time = *lt;
        spec.timezone = json_extract_string(body, "timezone");
        std::string err;
        auto rec = recurrence_from_body(body, "none", err);
        if (!rec) return error_response(http::status::bad_request, req, "invalid_recurrence", err);
        spec.recurrence = *rec;
        spec.payload = json_extract_string(body, "payload");
    } catch (const std::runtime_error& e) {
        return error_response(http::status::bad_request, req, "validation_error", e.what());
    }
    try {
        return mutation_response(registry_.create(spec), req, http::status::created);
    } catch (const store::StoreError& e) {
        observability::log_error("api.store_error", {{"op", std::string("create")}, {"err", std::string(e.what())}});
        return error_response(http::status::service_unavailable, req, "store_unavailable", e.what());
    }
}

Response EventsApi::list(const Request& req) const {
    std::string owner = query_param(req, "owner");
    if (owner.empty()) return error_response(http::status::bad_request, req, "validation_error", "owner query parameter is required");
    bool all = query_param(req, "all") == "1";
    std::ostringstream ss;
    ss << "{\"events\":[";
    bool first = true;
    for (const auto& rec : registry_.list(owner, all)) {
        if (!first) ss << ',';
        first = false;
        ss << record_json(rec);
    }
    ss << "]}";
    return make_json_response(http::status::ok, req, ss.str());
}

Response EventsApi::get(const Request& req) const {
    auto id = id_from_path(req);
    if (!id) return error_response(http::status::not_found, req, "not_found", "no such event");
    auto rec = registry_.get(*id);
    if (!rec) return error_response(http::status::not_found, req, "not_found", "no such event");
    return make_json_response(http::status::ok, req, record_json(*rec));
}

Response EventsApi::modify(const Request& req) {
    auto id = id_from_path(req);
    if (!id) return error_response(http::status::not_found, req, "not_found", "no such event");
    const std::string& body = req.body();
    if (!looks_like_object(body)) return error_response(http::status::bad_request, req, "validation_error", "body must be a JSON object");
    auto current = registry_.get(*id);
    if (!current) return error_response(http::status::not_found, req, "not_found", "no such event");

    engine::EventPatch patch;
    try {
        auto t = json_extract_string_opt_present(body, "time");
        if (t.first) {
            auto lt = model::parse_local_time(t.second.value_or(std::string()), "");
            if (!lt) return error_response(http::status::bad_request, req, "validation_error", "time must be HH:MM[:SS]");
            patch.time_of_day = *lt;
        }
        auto d = json_extract_string_opt_present(body, "date");
        if (d.first) {
            if (!d.second) {
                patch.date = std::optional<model::LocalDate>();
            } else {
                auto parsed = model::parse_date(*d.second);
                if (!parsed) return error_response(http::status::bad_request, req, "validation_error", "date must be YYYY-MM-DD");
                patch.date = std::optional<model::LocalDate>(*parsed);
            }
        }
        auto tz = json_extract_string_present(body, "timezone");
        if (tz.first) patch.timezone = tz.second;
        bool touches_recurrence = json_extract_string_opt_present(body, "recurrence").first ||
                                  json_extract_string_opt_present(body, "weekdays").first ||
                                  json_extract_int_opt(body, "interval_sec").has_value();
        if (touches_recurrence) {
            std::string err;
            auto rec = recurrence_from_body(body, model::recurrence_name(current->recurrence), err);
            if (!rec) return error_response(http::status::bad_request, req, "invalid_recurrence", err);
            // keep the current day-set or interval unless the body replaces it
            if (auto w = std::get_if<model::Weekly>(&*rec); w && w->days == 0 && !json_extract_string_opt_present(body, "weekdays").first) {
                if (auto cw = std::get_if<model::Weekly>(&current->recurrence)) w->days = cw->days;
            }
            if (auto c = std::get_if<model::Custom>(&*rec); c && c->interval_sec == 0 && !json_extract_int_opt(body, "interval_sec")) {
                if (auto cc = std::get_if<model::Custom>(&current->recurrence)) c->interval_sec = cc->interval_sec;
            }
            patch.recurrence = *rec;
        }
        auto payload = json_extract_string_present(body, "payload");
        if (payload.first) patch.payload = payload.second;
        auto version = json_extract_int_opt(body, "version");
        if (version) {
            if (*version <= 0) return error_response(http::status::bad_request, req, "validation_error", "version must be positive");
            patch.expected_version = uint64_t(*version);
        }
    } catch (const std::runtime_error& e) {
        return error_response(http::status::bad_request, req, "validation_error", e.what());
    }
    try {
        return mutation_response(registry_.modify(*id, patch), req, http::status::ok);
    } catch (const store::StoreError& e) {
        observability::log_error("api.store_error", {{"op", std::string("modify")}, {"err", std::string(e.what())}});
        return error_response(http::status::service_unavailable, req, "store_unavailable", e.what());
    }
}

Response EventsApi::cancel(const Request& req) {
    auto id = id_from_path(req);
    if (!id) return error_response(http::status::not_found, req, "not_found", "no such event");
    try {
        return mutation_response(registry_.cancel(*id), req, http::status::ok);
    } catch (const store::StoreError& e) {
        observability::log_error("api.store_error", {{"op", std::string("cancel")}, {"err", std::string(e.what())}});
        return error_response(http::status::service_unavailable, req, "store_unavailable", e.what());
    }
}
