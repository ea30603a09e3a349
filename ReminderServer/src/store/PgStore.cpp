#include "PgStore.h"
#include "../observability/Logging.h"
#include "../net/MiniJson.h"
#include <stdexcept>

namespace store {

PgStore::PgStore(const std::string& conninfo, int64_t lock_key)
    : lock_key_(lock_key), lock_conn_(conninfo), conn_(conninfo) {}

PgStore::~PgStore() {
    if (!locked_) return;
    try {
        lock_conn_.exec_params("SELECT pg_advisory_unlock($1)", {std::to_string(lock_key_)});
        observability::log_info("store.lock_released", {{"lock_key", lock_key_}});
    } catch (const std::runtime_error& e) {
        // closing the session drops the lock anyway
        observability::log_warn("store.unlock_failed", {{"err", std::string(e.what())}});
    }
}

std::unique_ptr<PgStore> PgStore::open(const std::string& conninfo, int64_t lock_key) {
    if (conninfo.empty()) throw StoreUnavailable("DATABASE_URL is not set");
    std::unique_ptr<PgStore> st(new PgStore(conninfo, lock_key));
    if (!st->lock_conn_.connect()) throw StoreUnavailable("cannot connect to database");

    db::DbResult r;
    try {
        r = st->lock_conn_.exec_params("SELECT pg_try_advisory_lock($1)", {std::to_string(lock_key)});
    } catch (const std::runtime_error& e) {
        throw StoreUnavailable(e.what());
    }
    if (!r.ok || r.rows.empty() || r.rows[0].empty() || !r.rows[0][0].has_value()) throw StoreUnavailable("advisory lock query failed: " + r.message);
    if (r.rows[0][0].value() != "t") throw AlreadyRunning("advisory lock " + std::to_string(lock_key));
    st->locked_ = true;

    try {
        st->ensure_schema();
    } catch (const StoreError& e) {
        throw StoreUnavailable(e.what());
    }
    observability::log_info("store.opened", {{"backend", std::string("postgres")}, {"lock_key", lock_key}});
    return st;
}

db::DbResult PgStore::run(const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    db::DbResult r;
    try {
        r = conn_.exec_params(sql, params);
    } catch (const std::runtime_error& e) {
        throw StoreError(e.what());
    }
    if (!r.ok) throw StoreError("query failed: " + r.sqlstate + " " + r.message);
    return r;
}

void PgStore::ensure_schema() {
    std::lock_guard<std::mutex> lk(mu_);
    run("CREATE TABLE IF NOT EXISTS reminder_events ("
        "id BIGINT PRIMARY KEY, "
        "owner_context TEXT NOT NULL, "
        "state TEXT NOT NULL, "
        "version BIGINT NOT NULL, "
        "body TEXT NOT NULL, "
        "updated_at TIMESTAMPTZ NOT NULL DEFAULT now())", {});
    run("CREATE INDEX IF NOT EXISTS reminder_events_owner_idx ON reminder_events(owner_context)", {});
    run("CREATE SEQUENCE IF NOT EXISTS reminder_event_id_seq", {});
    // the sequence never hands out an id that is already taken
    run("SELECT setval('reminder_event_id_seq', t.m) FROM (SELECT MAX(id) AS m FROM reminder_events) t "
        "WHERE t.m IS NOT NULL AND t.m >= (SELECT last_value FROM reminder_event_id_seq)", {});
}

PutResult PgStore::put(uint64_t id, const model::EventRecord& record, uint64_t expected_version) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string body = model::to_json(record);
    db::DbResult r;
    if (expected_version == 0) {
        r = run("INSERT INTO reminder_events(id, owner_context, state, version, body) VALUES($1, $2, $3, $4, $5) "
                "ON CONFLICT (id) DO NOTHING",
                {std::to_string(id), record.owner_context, model::state_name(record.state), std::to_string(record.version), body});
    } else {
        r = run("UPDATE reminder_events SET owner_context=$2, state=$3, version=$4, body=$5, updated_at=now() "
                "WHERE id=$1 AND version=$6",
                {std::to_string(id), record.owner_context, model::state_name(record.state), std::to_string(record.version), body,
                 std::to_string(expected_version)});
    }
    return r.affected_rows == 1 ? PutResult::Ok : PutResult::VersionConflict;
}

std::optional<model::EventRecord> PgStore::get(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto r = run("SELECT body FROM reminder_events WHERE id=$1", {std::to_string(id)});
    if (r.rows.empty()) return std::nullopt;
    const auto& body = r.rows[0][0];
    auto rec = body.has_value() ? model::from_json(*body) : std::nullopt;
    if (!rec) throw CorruptRecord(id, "unparseable body");
    if (rec->id != id) throw CorruptRecord(id, "id mismatch");
    return rec;
}

ScanResult PgStore::scan() {
    db::DbResult r;
    {
        std::lock_guard<std::mutex> lk(mu_);
        r = run("SELECT id, body FROM reminder_events ORDER BY id", {});
    }
    ScanResult out;
    for (const auto& row : r.rows) {
        int64_t id = 0;
        if (row[0].has_value()) id = parse_int64_strict_sv(*row[0]).value_or(0);
        auto rec = row[1].has_value() ? model::from_json(*row[1]) : std::nullopt;
        if (!rec || int64_t(rec->id) != id) {
            observability::log_warn("store.corrupt_record", {{"id", id}, {"err", std::string("unparseable body")}});
            ++out.corrupt;
            continue;
        }
        out.records.push_back(std::move(*rec));
    }
    return out;
}

bool PgStore::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto r = run("DELETE FROM reminder_events WHERE id=$1", {std::to_string(id)});
    return r.affected_rows > 0;
}

uint64_t PgStore::next_id() {
    std::lock_guard<std::mutex> lk(mu_);
    auto r = run("SELECT nextval('reminder_event_id_seq')", {});
    if (r.rows.empty() || r.rows[0].empty() || !r.rows[0][0].has_value()) throw StoreError("nextval returned no row");
    auto v = parse_int64_strict_sv(*r.rows[0][0]);
    if (!v.has_value() || *v <= 0) throw StoreError("nextval returned " + *r.rows[0][0]);
    return uint64_t(*v);
}

}
