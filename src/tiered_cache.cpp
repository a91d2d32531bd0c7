#include "audiocache/tiered_cache.hpp"
#include "audiocache/errors.hpp"
#include "audiocache/health_monitor.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace audiocache {

// --- Internal Data Structures ---

// One generation shared by every concurrent caller of the same key.
struct InFlight {
    std::promise<Bytes> promise;
    std::shared_future<Bytes> result;
    CancellationToken token;
    bool settled = false;  // guarded by TieredCacheManagerImpl::inflight_mutex_
};

// PIMPL: Private Implementation
class TieredCacheManagerImpl {
public:
    TieredCacheManagerImpl(std::shared_ptr<TierStore> memory,
                           std::shared_ptr<TierStore> disk,
                           std::shared_ptr<TierStore> remote,
                           const DegradedModeFlags& flags,
                           std::shared_ptr<MetricsRecorder> metrics,
                           TieredCacheManager::Options options);
    ~TieredCacheManagerImpl();

    GetResult GetOrCreate(const std::string& key, const Generator& generator,
                          std::chrono::milliseconds timeout);
    bool Cancel(const std::string& key);
    void Invalidate(const std::string& key);
    void AttachHealthMonitor(DependencyHealthMonitor* monitor);
    void Drain();
    std::size_t SweepExpired();
    CacheStatsSnapshot Stats() const;

private:
    std::optional<GetResult> lookup(const std::string& key);
    void promote(const std::string& key, const CacheEntry& entry, std::size_t hit_index);
    void generate(const std::string& key, Generator generator, std::shared_ptr<InFlight> flight);
    void write_through(const std::string& key, const Bytes& payload, std::int64_t created_at_ms);
    void write_remote(const std::string& key, const Bytes& payload, std::int64_t created_at_ms);
    bool settle(const std::string& key, const std::shared_ptr<InFlight>& flight,
                const Bytes* payload, std::exception_ptr error);
    bool remote_usable(const TierStore& tier) const;
    void report_remote_failure(const std::string& what);
    void spawn(std::function<void()> task);

    std::vector<std::shared_ptr<TierStore>> tiers_;  // fastest first
    const DegradedModeFlags& flags_;
    std::shared_ptr<MetricsRecorder> metrics_;
    TieredCacheManager::Options options_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    CacheStats stats_;

    std::atomic<DependencyHealthMonitor*> monitor_{nullptr};

    // Request coalescing
    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_ptr<InFlight>> inflight_;

    // Background generations and remote writes
    std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    std::size_t pending_tasks_ = 0;
};


// --- TieredCacheManagerImpl Implementation ---

TieredCacheManagerImpl::TieredCacheManagerImpl(std::shared_ptr<TierStore> memory,
                                               std::shared_ptr<TierStore> disk,
                                               std::shared_ptr<TierStore> remote,
                                               const DegradedModeFlags& flags,
                                               std::shared_ptr<MetricsRecorder> metrics,
                                               TieredCacheManager::Options options)
    : flags_(flags), metrics_(std::move(metrics)), options_(std::move(options)) {
    if (!memory || !disk) {
        throw ConfigurationError("memory and disk tiers are required");
    }
    if (options_.default_timeout.count() <= 0) {
        throw ConfigurationError("default_timeout must be positive");
    }
    if (!metrics_) {
        metrics_ = std::make_shared<NullMetricsRecorder>();
    }
    tiers_.push_back(std::move(memory));
    tiers_.push_back(std::move(disk));
    if (remote) {
        tiers_.push_back(std::move(remote));
    }

    sweeper_ = std::make_unique<ExpirySweeper>(
        std::vector<TierStore*>{tiers_[0].get(), tiers_[1].get()}, options_.sweep_interval);
    if (options_.start_sweeper) {
        sweeper_->Start();
    }
}

TieredCacheManagerImpl::~TieredCacheManagerImpl() {
    sweeper_->Stop();

    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        for (const auto& kv : inflight_) {
            keys.push_back(kv.first);
        }
    }
    for (const auto& key : keys) {
        Cancel(key);
    }
    Drain();
}

bool TieredCacheManagerImpl::remote_usable(const TierStore& tier) const {
    return tier.tier() != Tier::kRemote || !flags_.RemoteBypassed();
}

void TieredCacheManagerImpl::report_remote_failure(const std::string& what) {
    metrics_->Record("RemoteCacheError", 1.0, "Count");
    DependencyHealthMonitor* monitor = monitor_.load();
    if (monitor && monitor->Tracks(options_.remote_dependency)) {
        monitor->RecordResult(options_.remote_dependency, ProbeResult::Failure(what));
    }
}

void TieredCacheManagerImpl::spawn(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        ++pending_tasks_;
    }
    std::thread([this, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background cache task failed: {}", e.what());
        }
        // Notify under the lock: the destructor may run as soon as it sees zero.
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        --pending_tasks_;
        tasks_cv_.notify_all();
    }).detach();
}

void TieredCacheManagerImpl::Drain() {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    tasks_cv_.wait(lock, [this] { return pending_tasks_ == 0; });
}

std::optional<GetResult> TieredCacheManagerImpl::lookup(const std::string& key) {
    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        TierStore& tier = *tiers_[i];
        if (!remote_usable(tier)) {
            continue;
        }

        std::optional<CacheEntry> entry;
        try {
            entry = tier.Get(key);
        } catch (const TransientDependencyError& e) {
            spdlog::warn("{} tier unavailable for {}: {}", TierName(tier.tier()), key, e.what());
            report_remote_failure(e.what());
            continue;
        } catch (const std::exception& e) {
            spdlog::error("{} tier read error for {}: {}", TierName(tier.tier()), key, e.what());
            continue;
        }
        if (!entry) {
            continue;
        }

        stats_.RecordHit(tier.tier());
        metrics_->Record("CacheHit", 1.0, "Count", {{"Tier", TierName(tier.tier())}});
        spdlog::debug("{} cache hit: {}", TierName(tier.tier()), key);

        promote(key, *entry, i);
        return GetResult{std::move(entry->payload), HitSourceFor(tier.tier())};
    }
    return std::nullopt;
}

void TieredCacheManagerImpl::promote(const std::string& key, const CacheEntry& entry, std::size_t hit_index) {
    // The copy keeps the original creation time so promotion never extends the TTL.
    EntryMetadata meta{entry.created_at_ms};
    for (std::size_t i = 0; i < hit_index; ++i) {
        TierStore& faster = *tiers_[i];
        try {
            if (!faster.Put(key, entry.payload, meta)) {
                stats_.RecordPromotionFailure();
                spdlog::warn("Promotion of {} into {} tier failed", key, TierName(faster.tier()));
            }
        } catch (const std::exception& e) {
            stats_.RecordPromotionFailure();
            spdlog::warn("Promotion of {} into {} tier failed: {}", key, TierName(faster.tier()), e.what());
        }
    }
}

GetResult TieredCacheManagerImpl::GetOrCreate(const std::string& key, const Generator& generator,
                                              std::chrono::milliseconds timeout) {
    stats_.RecordRequest();
    if (timeout.count() <= 0) {
        timeout = options_.default_timeout;
    }

    if (auto hit = lookup(key)) {
        return std::move(*hit);
    }

    std::shared_ptr<InFlight> flight;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            flight = it->second;
        } else {
            flight = std::make_shared<InFlight>();
            flight->result = flight->promise.get_future().share();
            inflight_.emplace(key, flight);
            leader = true;
        }
    }

    if (leader) {
        // A generation for this key may have finished between our lookup and
        // registering; it left the payload in memory.
        std::optional<CacheEntry> late;
        try {
            late = tiers_[0]->Get(key);
        } catch (const std::exception& e) {
            spdlog::warn("Memory tier re-check failed for {}: {}", key, e.what());
        }
        if (late) {
            stats_.RecordHit(Tier::kMemory);
            settle(key, flight, &late->payload, nullptr);
            return GetResult{std::move(late->payload), HitSource::kMemory};
        }

        stats_.RecordMiss();
        metrics_->Record("CacheMiss", 1.0, "Count");
        spdlog::info("Generating new audio for {}", key);
        spawn([this, key, generator, flight] { generate(key, generator, flight); });
    } else {
        stats_.RecordCoalescedWait();
        spdlog::debug("Joining in-flight generation for {}", key);
    }

    if (flight->result.wait_for(timeout) != std::future_status::ready) {
        throw GenerationTimeoutError("generation for " + key + " did not finish within " +
                                     std::to_string(timeout.count()) + " ms");
    }
    // Rethrows the generator's error, or the cancellation, for every waiter.
    return GetResult{flight->result.get(), HitSource::kGenerated};
}

void TieredCacheManagerImpl::generate(const std::string& key, Generator generator,
                                      std::shared_ptr<InFlight> flight) {
    Bytes payload;
    std::exception_ptr error;
    try {
        payload = generator(key, flight->token);
    } catch (...) {
        // Handed to every waiter below.
        error = std::current_exception();
    }

    if (!error && flight->token.IsCancelled()) {
        error = std::make_exception_ptr(GenerationCancelledError("generation cancelled for " + key));
    }

    if (error) {
        stats_.RecordGenerationFailure();
        metrics_->Record("GenerationFailure", 1.0, "Count");
        settle(key, flight, nullptr, error);
        return;
    }

    stats_.RecordGenerated();
    write_through(key, payload, options_.clock());
    settle(key, flight, &payload, nullptr);
}

bool TieredCacheManagerImpl::settle(const std::string& key, const std::shared_ptr<InFlight>& flight,
                                    const Bytes* payload, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    if (flight->settled) {
        return false;
    }
    flight->settled = true;
    auto it = inflight_.find(key);
    if (it != inflight_.end() && it->second == flight) {
        inflight_.erase(it);
    }
    if (error) {
        flight->promise.set_exception(error);
    } else {
        flight->promise.set_value(*payload);
    }
    return true;
}

void TieredCacheManagerImpl::write_through(const std::string& key, const Bytes& payload,
                                           std::int64_t created_at_ms) {
    EntryMetadata meta{created_at_ms};

    // Memory and disk synchronously; a failure here never fails the caller.
    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        TierStore& tier = *tiers_[i];
        if (tier.tier() == Tier::kRemote) {
            continue;
        }
        try {
            if (!tier.Put(key, payload, meta)) {
                spdlog::warn("{} cache write failed for {}", TierName(tier.tier()), key);
            }
        } catch (const std::exception& e) {
            spdlog::warn("{} cache write failed for {}: {}", TierName(tier.tier()), key, e.what());
        }
    }

    if (tiers_.size() > 2 && remote_usable(*tiers_[2])) {
        spawn([this, key, payload, created_at_ms] { write_remote(key, payload, created_at_ms); });
    }
}

void TieredCacheManagerImpl::write_remote(const std::string& key, const Bytes& payload,
                                          std::int64_t created_at_ms) {
    TierStore& remote = *tiers_[2];
    try {
        if (remote.Put(key, payload, EntryMetadata{created_at_ms})) {
            return;
        }
        spdlog::error("Remote cache store failed for {}", key);
    } catch (const TransientDependencyError& e) {
        spdlog::error("Remote cache store failed for {}: {}", key, e.what());
        report_remote_failure(e.what());
    } catch (const std::exception& e) {
        spdlog::error("Remote cache store rejected {}: {}", key, e.what());
    }
    stats_.RecordRemoteWriteFailure();
    metrics_->Record("RemoteCacheWriteFailure", 1.0, "Count");
}

bool TieredCacheManagerImpl::Cancel(const std::string& key) {
    std::shared_ptr<InFlight> flight;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key);
        if (it == inflight_.end()) {
            return false;
        }
        flight = it->second;
    }
    flight->token.Cancel();
    const bool released = settle(
        key, flight, nullptr,
        std::make_exception_ptr(GenerationCancelledError("generation cancelled for " + key)));
    if (released) {
        spdlog::info("Cancelled generation for {}", key);
    }
    return released;
}

void TieredCacheManagerImpl::Invalidate(const std::string& key) {
    for (const auto& tier : tiers_) {
        if (!remote_usable(*tier)) {
            continue;
        }
        try {
            tier->Remove(key);
        } catch (const TransientDependencyError& e) {
            spdlog::warn("Could not invalidate {} in {} tier: {}", key, TierName(tier->tier()), e.what());
            report_remote_failure(e.what());
        }
    }
}

void TieredCacheManagerImpl::AttachHealthMonitor(DependencyHealthMonitor* monitor) {
    monitor_.store(monitor);
}

std::size_t TieredCacheManagerImpl::SweepExpired() {
    return sweeper_->SweepOnce();
}

CacheStatsSnapshot TieredCacheManagerImpl::Stats() const {
    CacheStatsSnapshot snapshot = stats_.Snapshot();
    snapshot.memory_entries = tiers_[0]->Size();
    snapshot.memory_capacity = tiers_[0]->Capacity();
    snapshot.disk_entries = tiers_[1]->Size();
    snapshot.disk_capacity = tiers_[1]->Capacity();
    return snapshot;
}


// --- TieredCacheManager Public API (forwarding to PIMPL) ---

TieredCacheManager::TieredCacheManager(std::shared_ptr<TierStore> memory,
                                       std::shared_ptr<TierStore> disk,
                                       std::shared_ptr<TierStore> remote,
                                       const DegradedModeFlags& flags,
                                       std::shared_ptr<MetricsRecorder> metrics,
                                       Options options)
    : p_impl(std::make_unique<TieredCacheManagerImpl>(std::move(memory), std::move(disk), std::move(remote),
                                                      flags, std::move(metrics), std::move(options))) {}
TieredCacheManager::~TieredCacheManager() = default;
GetResult TieredCacheManager::GetOrCreate(const std::string& key, const Generator& generator) {
    return GetOrCreate(key, generator, std::chrono::milliseconds(0));
}
GetResult TieredCacheManager::GetOrCreate(const std::string& key, const Generator& generator,
                                          std::chrono::milliseconds timeout) {
    return p_impl->GetOrCreate(key, generator, timeout);
}
bool TieredCacheManager::Cancel(const std::string& key) { return p_impl->Cancel(key); }
void TieredCacheManager::Invalidate(const std::string& key) { p_impl->Invalidate(key); }
void TieredCacheManager::AttachHealthMonitor(DependencyHealthMonitor* monitor) { p_impl->AttachHealthMonitor(monitor); }
void TieredCacheManager::Drain() { p_impl->Drain(); }
std::size_t TieredCacheManager::SweepExpired() { return p_impl->SweepExpired(); }
CacheStatsSnapshot TieredCacheManager::Stats() const { return p_impl->Stats(); }

} // namespace audiocache
