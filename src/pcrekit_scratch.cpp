// PCREKit - Per-Thread Scratch Cache Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_scratch.h"
#include "pcrekit_platform.h"

#include <functional>
#include <mutex>
#include <queue>
#include <vector>

namespace pcrekit {

// ============================================================================
// Thread Slot Registry
// ============================================================================

namespace {

// Recycles ids of exited threads, smallest first, so slot numbers stay dense
class ThreadSlotRegistry {
public:
    size_t acquire() {
        std::lock_guard<std::mutex> guard(lock);
        if (freeSlots.empty()) {
            return nextSlot++;
        }
        size_t slot = freeSlots.top();
        freeSlots.pop();
        return slot;
    }

    void release(size_t slot) {
        std::lock_guard<std::mutex> guard(lock);
        freeSlots.push(slot);
    }

private:
    std::mutex lock;
    size_t nextSlot = 0;
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> freeSlots;
};

// Never destroyed: threads may still exit after static destructors ran
ThreadSlotRegistry& registry() {
    static ThreadSlotRegistry* instance = new ThreadSlotRegistry();
    return *instance;
}

struct ThreadSlot {
    size_t id;
    ThreadSlot() : id(registry().acquire()) {}
    ~ThreadSlot() { registry().release(id); }
};

// Map a thread slot onto (bucket, index): slot + 1 = 2^bucket + index
void locate(size_t slot, size_t& bucket, size_t& index) {
    size_t n = slot + 1;
    bucket = 0;
    while ((n >> (bucket + 1)) != 0) {
        bucket++;
    }
    index = n - (static_cast<size_t>(1) << bucket);
}

} // namespace

size_t currentThreadSlot() {
    static thread_local ThreadSlot slot;
    return slot.id;
}

// ============================================================================
// ScratchCache
// ============================================================================

ScratchCache::ScratchCache(std::shared_ptr<const Code> c, const MatchConfig& cfg)
    : code(std::move(c)), config(cfg) {
    for (auto& bucket : buckets) {
        bucket.store(nullptr, std::memory_order_relaxed);
    }
}

ScratchCache::~ScratchCache() {
    for (auto& bucket : buckets) {
        delete[] bucket.load(std::memory_order_acquire);
    }
}

ScratchCache::Slot* ScratchCache::bucketFor(size_t bucket) {
    Slot* slots = buckets[bucket].load(std::memory_order_acquire);
    if (slots) {
        return slots;
    }

    Slot* fresh = new Slot[static_cast<size_t>(1) << bucket];
    Slot* expected = nullptr;
    if (buckets[bucket].compare_exchange_strong(expected, fresh,
            std::memory_order_acq_rel, std::memory_order_acquire)) {
        return fresh;
    }
    // Another thread published this bucket first
    delete[] fresh;
    return expected;
}

MatchData& ScratchCache::get() {
    size_t slot = currentThreadSlot();
    size_t bucket, index;
    locate(slot, bucket, index);

    Slot& entry = bucketFor(bucket)[index];
    if (!entry) {
        entry = std::make_unique<MatchData>(config, *code);
        createdCount.fetch_add(1, std::memory_order_relaxed);
        PCREKIT_LOG("created match scratch for thread slot %zu", slot);
    }
    return *entry;
}

} // namespace pcrekit
