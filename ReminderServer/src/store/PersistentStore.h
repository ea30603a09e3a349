#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../model/EventRecord.h"

namespace store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// store cannot be opened or reached at all
class StoreUnavailable : public StoreError {
public:
    explicit StoreUnavailable(const std::string& msg) : StoreError("store unavailable: " + msg) {}
};

// another process holds the write lock
class AlreadyRunning : public StoreError {
public:
    explicit AlreadyRunning(const std::string& where) : StoreError("store already locked: " + where) {}
};

class CorruptRecord : public StoreError {
public:
    CorruptRecord(uint64_t id, const std::string& why)
        : StoreError("corrupt record " + std::to_string(id) + ": " + why), id_(id) {}
    uint64_t id() const { return id_; }
private:
    uint64_t id_;
};

enum class PutResult { Ok, VersionConflict };

struct ScanResult {
    std::vector<model::EventRecord> records;
    int corrupt = 0;
};

// Durable record store. Each put is atomic for its record; the store holds an exclusive write lock
// for its whole lifetime.
class PersistentStore {
public:
    virtual ~PersistentStore() = default;

    // expected_version == 0 means the record must not exist yet; otherwise the stored version must
    // equal expected_version.
    virtual PutResult put(uint64_t id, const model::EventRecord& record, uint64_t expected_version) = 0;
    // nullopt when absent; throws CorruptRecord when present but unreadable
    virtual std::optional<model::EventRecord> get(uint64_t id) = 0;
    // every readable record, any state; unreadable ones are logged and counted
    virtual ScanResult scan() = 0;
    virtual bool remove(uint64_t id) = 0;
    virtual uint64_t next_id() = 0;

    std::vector<model::EventRecord> list_active();
};

}
