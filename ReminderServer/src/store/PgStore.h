#pragma once

#include "PersistentStore.h"
#include "../db/PgConnection.h"
#include <memory>
#include <mutex>
#include <string>

namespace store {

// Records live in table reminder_events; the write lock is a session-level advisory lock held on a
// connection of its own for the lifetime of the object.
class PgStore : public PersistentStore {
public:
    // Throws AlreadyRunning when the advisory lock is taken, StoreUnavailable when the server cannot
    // be reached or the schema cannot be created.
    static std::unique_ptr<PgStore> open(const std::string& conninfo, int64_t lock_key);
    ~PgStore() override;

    PutResult put(uint64_t id, const model::EventRecord& record, uint64_t expected_version) override;
    std::optional<model::EventRecord> get(uint64_t id) override;
    ScanResult scan() override;
    bool remove(uint64_t id) override;
    uint64_t next_id() override;

private:
    PgStore(const std::string& conninfo, int64_t lock_key);
    db::DbResult run(const std::string& sql, const std::vector<std::optional<std::string>>& params);
    void ensure_schema();

    int64_t lock_key_;
    bool locked_ = false;
    db::PgConnection lock_conn_;
    db::PgConnection conn_;
    std::mutex mu_;
};

}
