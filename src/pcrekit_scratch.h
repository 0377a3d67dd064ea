// PCREKit - Per-Thread Scratch Cache
// Copyright (c) 2026 greenteng.com
//
// Hands out one MatchData per calling thread for a single compiled pattern,
// so a shared Regex can be searched from many threads at once without
// locking and without allocating a scratch per search.

#ifndef PCREKIT_SCRATCH_H
#define PCREKIT_SCRATCH_H

#include "pcrekit_engine.h"

#include <atomic>
#include <memory>

namespace pcrekit {

// ============================================================================
// ScratchCache
// ============================================================================

// Threads are numbered with small integers that are recycled when a thread
// exits. Slots live in buckets of doubling size (bucket b holds 2^b slots),
// published with a CAS the first time a thread id lands in them. A slot is
// only ever touched by the thread that currently owns its id, so lookups
// take no lock.
class ScratchCache {
public:
    ScratchCache(std::shared_ptr<const Code> code, const MatchConfig& config);
    ~ScratchCache();

    ScratchCache(const ScratchCache&) = delete;
    ScratchCache& operator=(const ScratchCache&) = delete;

    // The calling thread's scratch, created on first use
    MatchData& get();

    // Number of scratches created so far
    size_t created() const { return createdCount.load(std::memory_order_relaxed); }

private:
    static constexpr size_t BUCKET_COUNT = sizeof(size_t) * 8;

    using Slot = std::unique_ptr<MatchData>;

    std::shared_ptr<const Code> code;
    MatchConfig config;
    std::atomic<Slot*> buckets[BUCKET_COUNT];
    std::atomic<size_t> createdCount{0};

    Slot* bucketFor(size_t bucket);
};

// Small integer identifying the calling thread, unique among live threads
size_t currentThreadSlot();

} // namespace pcrekit

#endif // PCREKIT_SCRATCH_H
