#pragma once

#include "cache_stats.hpp"
#include "degraded_mode.hpp"
#include "expiry.hpp"
#include "providers.hpp"
#include "tier_store.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace audiocache {

class DependencyHealthMonitor;

// Shared cancellation flag handed to a generator. Generators should poll it
// and stop early; waiters are released regardless.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }
    void Cancel() const { flag_->store(true, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Produces the payload for a key that no tier holds.
using Generator = std::function<Bytes(const std::string& key, const CancellationToken& token)>;

struct GetResult {
    Bytes payload;
    HitSource source = HitSource::kGenerated;
};

// Forward declaration of internal state
class TieredCacheManagerImpl;

/**
 * @class TieredCacheManager
 * @brief Lookup with promotion, write-through and per-key request coalescing
 * over the memory, disk and remote tiers.
 *
 * Remote is optional and is skipped while DegradedModeFlags reports it
 * bypassed. At most one generator runs per key at a time; every concurrent
 * caller for that key receives the same payload or the same error.
 */
class TieredCacheManager {
public:
    struct Options {
        std::chrono::milliseconds default_timeout = std::chrono::seconds(30);
        std::chrono::milliseconds sweep_interval = std::chrono::hours(1);
        bool start_sweeper = true;
        ClockFn clock = SystemNowMs;
        // Name under which remote failures are reported to the health monitor.
        std::string remote_dependency = "durable-store";
    };

    TieredCacheManager(std::shared_ptr<TierStore> memory,
                       std::shared_ptr<TierStore> disk,
                       std::shared_ptr<TierStore> remote,
                       const DegradedModeFlags& flags,
                       std::shared_ptr<MetricsRecorder> metrics,
                       Options options);
    ~TieredCacheManager();

    // Uses Options::default_timeout. A zero timeout also means the default.
    GetResult GetOrCreate(const std::string& key, const Generator& generator);
    GetResult GetOrCreate(const std::string& key, const Generator& generator,
                          std::chrono::milliseconds timeout);

    // Releases every waiter on `key` with GenerationCancelledError.
    // Returns false when no generation was in flight.
    bool Cancel(const std::string& key);

    // Removes `key` from every reachable tier.
    void Invalidate(const std::string& key);

    // Not owned; must outlive this manager.
    void AttachHealthMonitor(DependencyHealthMonitor* monitor);

    // Waits for in-flight generations and asynchronous remote writes.
    void Drain();

    // Runs one expiry sweep over memory and disk now.
    std::size_t SweepExpired();

    CacheStatsSnapshot Stats() const;

private:
    // PIMPL Idiom
    std::unique_ptr<TieredCacheManagerImpl> p_impl;

    TieredCacheManager(const TieredCacheManager&) = delete;
    TieredCacheManager& operator=(const TieredCacheManager&) = delete;
    TieredCacheManager(TieredCacheManager&&) = delete;
    TieredCacheManager& operator=(TieredCacheManager&&) = delete;
};

} // namespace audiocache
