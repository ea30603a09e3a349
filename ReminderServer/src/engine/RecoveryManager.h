#pragma once

#include <cstdint>
#include "Clock.h"
#include "EventRegistry.h"

namespace store { class PersistentStore; }

namespace engine {

struct RecoveryReport {
    int loaded = 0;
    int due_now = 0;            // overdue within the grace window, left due so they fire once
    int skipped_missed = 0;     // recurring, advanced past missed occurrences without firing
    int completed_missed = 0;   // single-shots missed beyond the grace window
    int corrupt = 0;
    int garbage_collected = 0;
};

// Startup reconciliation: loads every record, applies the catch-up policy to overdue ones and
// fills the registry and fire queue. Requires the store lock to be held already.
class RecoveryManager {
public:
    RecoveryManager(store::PersistentStore& store, EventRegistry& registry, const Clock& clock,
                    int64_t grace_sec, int64_t retention_sec);

    // Throws store::StoreError when the store cannot be scanned.
    RecoveryReport run();

private:
    store::PersistentStore& store_;
    EventRegistry& registry_;
    const Clock& clock_;
    int64_t grace_sec_;
    int64_t retention_sec_;
};

}
