#pragma once

#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace engine {

struct FireEntry {
    time_t fire_at = 0;
    uint64_t id = 0;
    uint64_t version = 0;   // record version the fire instant was computed for
    uint64_t seq = 0;       // insertion order, breaks ties on equal instants
};

// Min-heap on (fire_at, seq) with an id -> slot index, so entries can be replaced or removed by id.
// At most one entry per id. Thread-safe.
class FireQueue {
public:
    // replaces any queued entry for the same id
    void push(time_t fire_at, uint64_t id, uint64_t version);
    std::optional<FireEntry> peek_min() const;
    std::optional<FireEntry> pop_min();
    // every entry with fire_at <= now, in order
    std::vector<FireEntry> pop_due(time_t now);
    // no-op for an absent id
    bool remove(uint64_t id);
    bool contains(uint64_t id) const;
    std::optional<FireEntry> find(uint64_t id) const;
    size_t size() const;
    bool empty() const;
    void clear();

private:
    static bool before(const FireEntry& a, const FireEntry& b);
    void sift_up(size_t i);
    void sift_down(size_t i);
    void swap_slots(size_t a, size_t b);
    void erase_at(size_t i);
    FireEntry pop_front();

    std::vector<FireEntry> heap_;
    std::unordered_map<uint64_t, size_t> pos_;
    uint64_t next_seq_ = 0;
    mutable std::mutex mu_;
};

}
