#include "FireQueue.h"
#include <utility>

namespace engine {

bool FireQueue::before(const FireEntry& a, const FireEntry& b) {
    if (a.fire_at != b.fire_at) return a.fire_at < b.fire_at;
    return a.seq < b.seq;
}

void FireQueue::swap_slots(size_t a, size_t b) {
    std::swap(heap_[a], heap_[b]);
    pos_[heap_[a].id] = a;
    pos_[heap_[b].id] = b;
}

void FireQueue::sift_up(size_t i) {
    while (i > 0) {
        size_t parent = (i - 1) / 2;
        if (!before(heap_[i], heap_[parent])) break;
        swap_slots(i, parent);
        i = parent;
    }
}

void FireQueue::sift_down(size_t i) {
    const size_t n = heap_.size();
    for (;;) {
        size_t l = 2 * i + 1, r = l + 1, best = i;
        if (l < n && before(heap_[l], heap_[best])) best = l;
        if (r < n && before(heap_[r], heap_[best])) best = r;
        if (best == i) return;
        swap_slots(i, best);
        i = best;
    }
}

void FireQueue::erase_at(size_t i) {
    pos_.erase(heap_[i].id);
    size_t last = heap_.size() - 1;
    if (i != last) {
        heap_[i] = heap_[last];
        pos_[heap_[i].id] = i;
    }
    heap_.pop_back();
    if (i < heap_.size()) {
        sift_up(i);
        sift_down(i);
    }
}

FireEntry FireQueue::pop_front() {
    FireEntry e = heap_.front();
    erase_at(0);
    return e;
}

void FireQueue::push(time_t fire_at, uint64_t id, uint64_t version) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pos_.find(id);
    if (it != pos_.end()) erase_at(it->second);
    heap_.push_back(FireEntry{fire_at, id, version, next_seq_++});
    pos_[id] = heap_.size() - 1;
    sift_up(heap_.size() - 1);
}

std::optional<FireEntry> FireQueue::peek_min() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (heap_.empty()) return std::nullopt;
    return heap_.front();
}

std::optional<FireEntry> FireQueue::pop_min() {
    std::lock_guard<std::mutex> lk(mu_);
    if (heap_.empty()) return std::nullopt;
    return pop_front();
}

std::vector<FireEntry> FireQueue::pop_due(time_t now) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<FireEntry> out;
    while (!heap_.empty() && heap_.front().fire_at <= now) out.push_back(pop_front());
    return out;
}

bool FireQueue::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pos_.find(id);
    if (it == pos_.end()) return false;
    erase_at(it->second);
    return true;
}

bool FireQueue::contains(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return pos_.count(id) != 0;
}

std::optional<FireEntry> FireQueue::find(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pos_.find(id);
    if (it == pos_.end()) return std::nullopt;
    return heap_[it->second];
}

size_t FireQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return heap_.size();
}

bool FireQueue::empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return heap_.empty();
}

void FireQueue::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    heap_.clear();
    pos_.clear();
}

}
