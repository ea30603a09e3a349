#pragma once

#include "PersistentStore.h"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace store {

// One file per record under <dir>/events, written through <dir>/staging and renamed into place.
// <dir>/LOCK is held with flock for the lifetime of the object.
class FileStore : public PersistentStore {
public:
    // Throws AlreadyRunning when another process holds the lock, StoreUnavailable on I/O failure.
    static std::unique_ptr<FileStore> open(const std::string& dir);
    ~FileStore() override;

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    PutResult put(uint64_t id, const model::EventRecord& record, uint64_t expected_version) override;
    std::optional<model::EventRecord> get(uint64_t id) override;
    ScanResult scan() override;
    bool remove(uint64_t id) override;
    uint64_t next_id() override;

    const std::string& dir() const { return dir_; }

    static std::string encode_record(const model::EventRecord& record);
    // throws CorruptRecord
    static model::EventRecord decode_record(uint64_t id, const std::string& contents);

private:
    FileStore(std::string dir, int lock_fd);

    std::string record_path(uint64_t id) const;
    std::optional<model::EventRecord> read_unlocked(uint64_t id) const;
    void write_atomic(const std::string& target, const std::string& contents);
    void load_counter();
    std::mutex& stripe(uint64_t id) { return stripes_[id % stripes_.size()]; }

    std::string dir_;
    std::string events_dir_;
    std::string staging_dir_;
    int lock_fd_ = -1;

    std::array<std::mutex, 64> stripes_;
    std::mutex counter_mu_;
    uint64_t next_id_ = 1;
    std::atomic<uint64_t> staging_seq_{0};
};

}
