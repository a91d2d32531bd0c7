#include "audiocache/cache_stats.hpp"

namespace audiocache {

void CacheStats::RecordHit(Tier tier) {
    switch (tier) {
        case Tier::kMemory: memory_hits_.fetch_add(1, std::memory_order_relaxed); break;
        case Tier::kDisk: disk_hits_.fetch_add(1, std::memory_order_relaxed); break;
        case Tier::kRemote: remote_hits_.fetch_add(1, std::memory_order_relaxed); break;
    }
}

CacheStatsSnapshot CacheStats::Snapshot() const {
    CacheStatsSnapshot s;
    s.total_requests = total_requests_.load(std::memory_order_relaxed);
    s.memory_hits = memory_hits_.load(std::memory_order_relaxed);
    s.disk_hits = disk_hits_.load(std::memory_order_relaxed);
    s.remote_hits = remote_hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.generated = generated_.load(std::memory_order_relaxed);
    s.generation_failures = generation_failures_.load(std::memory_order_relaxed);
    s.coalesced_waits = coalesced_waits_.load(std::memory_order_relaxed);
    s.promotion_failures = promotion_failures_.load(std::memory_order_relaxed);
    s.remote_write_failures = remote_write_failures_.load(std::memory_order_relaxed);
    return s;
}

double CacheStatsSnapshot::HitRate() const {
    return total_requests == 0 ? 0.0 : static_cast<double>(hits()) / total_requests * 100.0;
}

double CacheStatsSnapshot::TierHitRate(Tier tier) const {
    std::uint64_t hits_at = 0;
    switch (tier) {
        case Tier::kMemory: hits_at = memory_hits; break;
        case Tier::kDisk: hits_at = disk_hits; break;
        case Tier::kRemote: hits_at = remote_hits; break;
    }
    return total_requests == 0 ? 0.0 : static_cast<double>(hits_at) / total_requests * 100.0;
}

Json::Value CacheStatsSnapshot::ToJson() const {
    Json::Value root;
    Json::Value& stats = root["stats"];
    stats["totalRequests"] = Json::UInt64(total_requests);
    stats["memoryHits"] = Json::UInt64(memory_hits);
    stats["diskHits"] = Json::UInt64(disk_hits);
    stats["remoteHits"] = Json::UInt64(remote_hits);
    stats["misses"] = Json::UInt64(misses);
    stats["generated"] = Json::UInt64(generated);
    stats["generationFailures"] = Json::UInt64(generation_failures);
    stats["coalescedWaits"] = Json::UInt64(coalesced_waits);
    stats["promotionFailures"] = Json::UInt64(promotion_failures);
    stats["remoteWriteFailures"] = Json::UInt64(remote_write_failures);

    root["hitRate"] = HitRate();

    Json::Value& size = root["cacheSize"];
    size["memory"] = Json::UInt64(memory_entries);
    size["maxMemory"] = Json::UInt64(memory_capacity);
    size["disk"] = Json::UInt64(disk_entries);
    size["maxDisk"] = Json::UInt64(disk_capacity);

    Json::Value& perf = root["performance"];
    perf["memoryHitRate"] = TierHitRate(Tier::kMemory);
    perf["diskHitRate"] = TierHitRate(Tier::kDisk);
    perf["remoteHitRate"] = TierHitRate(Tier::kRemote);
    return root;
}

} // namespace audiocache
