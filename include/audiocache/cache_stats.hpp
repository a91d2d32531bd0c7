#pragma once

#include "types.hpp"

#include <json/json.h>

#include <atomic>
#include <cstdint>

namespace audiocache {

struct CacheStatsSnapshot {
    std::uint64_t total_requests = 0;
    std::uint64_t memory_hits = 0;
    std::uint64_t disk_hits = 0;
    std::uint64_t remote_hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t generated = 0;
    std::uint64_t generation_failures = 0;
    std::uint64_t coalesced_waits = 0;
    std::uint64_t promotion_failures = 0;
    std::uint64_t remote_write_failures = 0;

    // Occupancy at snapshot time, filled in by the manager.
    std::size_t memory_entries = 0;
    std::size_t memory_capacity = 0;
    std::size_t disk_entries = 0;
    std::size_t disk_capacity = 0;

    std::uint64_t hits() const { return memory_hits + disk_hits + remote_hits; }
    double HitRate() const;
    double TierHitRate(Tier tier) const;

    Json::Value ToJson() const;
};

// Counters only ever grow for the life of the process.
class CacheStats {
public:
    void RecordRequest() { total_requests_.fetch_add(1, std::memory_order_relaxed); }
    void RecordHit(Tier tier);
    void RecordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void RecordGenerated() { generated_.fetch_add(1, std::memory_order_relaxed); }
    void RecordGenerationFailure() { generation_failures_.fetch_add(1, std::memory_order_relaxed); }
    void RecordCoalescedWait() { coalesced_waits_.fetch_add(1, std::memory_order_relaxed); }
    void RecordPromotionFailure() { promotion_failures_.fetch_add(1, std::memory_order_relaxed); }
    void RecordRemoteWriteFailure() { remote_write_failures_.fetch_add(1, std::memory_order_relaxed); }

    CacheStatsSnapshot Snapshot() const;

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> memory_hits_{0};
    std::atomic<std::uint64_t> disk_hits_{0};
    std::atomic<std::uint64_t> remote_hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> generated_{0};
    std::atomic<std::uint64_t> generation_failures_{0};
    std::atomic<std::uint64_t> coalesced_waits_{0};
    std::atomic<std::uint64_t> promotion_failures_{0};
    std::atomic<std::uint64_t> remote_write_failures_{0};
};

} // namespace audiocache
