#include "PersistentStore.h"

namespace store {

std::vector<model::EventRecord> PersistentStore::list_active() {
    std::vector<model::EventRecord> out;
    for (auto& r : scan().records) {
        if (r.state == model::EventState::Active) out.push_back(std::move(r));
    }
    return out;
}

}
