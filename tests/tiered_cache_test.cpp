#include "audiocache/disk_tier.hpp"
#include "audiocache/failover.hpp"
#include "audiocache/health_monitor.hpp"
#include "audiocache/memory_tier.hpp"
#include "audiocache/remote_tier.hpp"
#include "audiocache/tiered_cache.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <thread>
#include <vector>

using namespace audiocache;
using namespace std::chrono_literals;

namespace {

// Blocks generators until the test opens it.
class Gate {
public:
    void Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }
    void Open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

} // namespace

class TieredCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<fakes::FakeObjectStorage>(clock_.Fn());
        metrics_ = std::make_shared<fakes::RecordingMetrics>();
        memory_ = std::make_shared<MemoryTier>(10, ExpiryTracker(24h, clock_.Fn()));
        disk_ = std::make_shared<DiskTier>(dir_.path(), 10, ExpiryTracker(24h, clock_.Fn()));
        remote_ = std::make_shared<RemoteTier>(storage_, "audio-cache/", ExpiryTracker(24h, clock_.Fn()));
        failover_ = std::make_unique<FailoverController>(
            flags_, std::make_shared<fakes::RecordingNotifier>(), metrics_, FailoverController::Options());
        MakeManager(remote_);
    }

    void MakeManager(std::shared_ptr<TierStore> remote) {
        cache_.reset();
        TieredCacheManager::Options options;
        options.start_sweeper = false;
        options.clock = clock_.Fn();
        options.default_timeout = 5s;
        cache_ = std::make_unique<TieredCacheManager>(memory_, disk_, std::move(remote), flags_, metrics_, options);
    }

    Generator Counting(const std::string& payload) {
        return [this, payload](const std::string&, const CancellationToken&) {
            calls_++;
            return ToBytes(payload);
        };
    }

    // Waits until `n` callers have joined an in-flight generation.
    void WaitForCoalescedWaits(std::uint64_t n) {
        for (int i = 0; i < 2000 && cache_->Stats().coalesced_waits < n; ++i) {
            std::this_thread::sleep_for(1ms);
        }
        ASSERT_GE(cache_->Stats().coalesced_waits, n);
    }

    fakes::TempDir dir_{"tiered"};
    fakes::ManualClock clock_;
    std::shared_ptr<fakes::FakeObjectStorage> storage_;
    std::shared_ptr<fakes::RecordingMetrics> metrics_;
    std::shared_ptr<MemoryTier> memory_;
    std::shared_ptr<DiskTier> disk_;
    std::shared_ptr<RemoteTier> remote_;
    DegradedModeFlags flags_;
    std::unique_ptr<FailoverController> failover_;
    std::atomic<int> calls_{0};
    std::unique_ptr<TieredCacheManager> cache_;
};

TEST_F(TieredCacheTest, GeneratesOnceThenServesFromMemory) {
    GetResult first = cache_->GetOrCreate("abc", Counting("X"));
    EXPECT_EQ(first.source, HitSource::kGenerated);
    EXPECT_EQ(ToString(first.payload), "X");

    GetResult second = cache_->GetOrCreate("abc", Counting("Y"));
    EXPECT_EQ(second.source, HitSource::kMemory);
    EXPECT_EQ(ToString(second.payload), "X");
    EXPECT_EQ(calls_.load(), 1);
}

TEST_F(TieredCacheTest, GenerationWritesThroughEveryTier) {
    cache_->GetOrCreate("abc", Counting("X"));
    EXPECT_TRUE(memory_->Exists("abc"));
    EXPECT_TRUE(disk_->Exists("abc"));

    cache_->Drain();
    EXPECT_TRUE(storage_->Contains("audio-cache/abc"));
}

TEST_F(TieredCacheTest, DiskHitIsPromotedToMemoryWithOriginalTimestamp) {
    const std::int64_t created = clock_.Now();
    disk_->Put("k", ToBytes("from-disk"), EntryMetadata{created});
    clock_.Advance(5min);

    GetResult result = cache_->GetOrCreate("k", Counting("unused"));
    EXPECT_EQ(result.source, HitSource::kDisk);
    EXPECT_EQ(ToString(result.payload), "from-disk");
    EXPECT_EQ(calls_.load(), 0);

    auto promoted = memory_->Get("k");
    ASSERT_TRUE(promoted.has_value());
    EXPECT_EQ(promoted->created_at_ms, created);

    EXPECT_EQ(cache_->GetOrCreate("k", Counting("unused")).source, HitSource::kMemory);
}

TEST_F(TieredCacheTest, RemoteHitIsPromotedToMemoryAndDisk) {
    storage_->Seed("audio-cache/k", "from-remote", clock_.Now());

    GetResult result = cache_->GetOrCreate("k", Counting("unused"));
    EXPECT_EQ(result.source, HitSource::kRemote);
    EXPECT_EQ(ToString(result.payload), "from-remote");
    EXPECT_TRUE(memory_->Exists("k"));
    EXPECT_TRUE(disk_->Exists("k"));
    EXPECT_EQ(calls_.load(), 0);
}

TEST_F(TieredCacheTest, ConcurrentCallersShareOneGeneration) {
    constexpr int kCallers = 8;
    Gate gate;
    Generator slow = [&](const std::string&, const CancellationToken&) {
        calls_++;
        gate.Wait();
        return ToBytes("shared");
    };

    std::vector<std::thread> threads;
    std::vector<std::string> results(kCallers);
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] { results[i] = ToString(cache_->GetOrCreate("hot", slow).payload); });
    }
    WaitForCoalescedWaits(kCallers - 1);
    gate.Open();
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls_.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, "shared");
    }
    CacheStatsSnapshot stats = cache_->Stats();
    EXPECT_EQ(stats.generated, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(TieredCacheTest, GenerationErrorReachesEveryWaiterAndIsNotCached) {
    constexpr int kCallers = 4;
    Gate gate;
    Generator failing = [&](const std::string&, const CancellationToken&) -> Bytes {
        calls_++;
        gate.Wait();
        throw FatalDependencyError("voice rejected");
    };

    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&] {
            try {
                cache_->GetOrCreate("bad", failing);
            } catch (const FatalDependencyError&) {
                errors++;
            }
        });
    }
    WaitForCoalescedWaits(kCallers - 1);
    gate.Open();
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(errors.load(), kCallers);
    EXPECT_EQ(calls_.load(), 1);
    EXPECT_FALSE(memory_->Exists("bad"));
    EXPECT_FALSE(disk_->Exists("bad"));
    EXPECT_EQ(cache_->Stats().generation_failures, 1u);

    // No negative caching: the next caller generates again.
    GetResult retry = cache_->GetOrCreate("bad", Counting("recovered"));
    EXPECT_EQ(retry.source, HitSource::kGenerated);
    EXPECT_EQ(ToString(retry.payload), "recovered");
}

TEST_F(TieredCacheTest, WaiterTimesOutButGenerationStillCompletes) {
    Gate gate;
    Generator slow = [&](const std::string&, const CancellationToken&) {
        gate.Wait();
        return ToBytes("late");
    };

    EXPECT_THROW(cache_->GetOrCreate("slow", slow, 50ms), GenerationTimeoutError);

    gate.Open();
    cache_->Drain();
    GetResult later = cache_->GetOrCreate("slow", Counting("unused"));
    EXPECT_EQ(later.source, HitSource::kMemory);
    EXPECT_EQ(ToString(later.payload), "late");
}

TEST_F(TieredCacheTest, CancelReleasesWaitersAndStoresNothing) {
    Generator until_cancelled = [](const std::string&, const CancellationToken& token) {
        while (!token.IsCancelled()) {
            std::this_thread::sleep_for(1ms);
        }
        return ToBytes("too late");
    };

    std::atomic<bool> cancelled{false};
    std::thread waiter([&] {
        try {
            cache_->GetOrCreate("c", until_cancelled);
        } catch (const GenerationCancelledError&) {
            cancelled = true;
        }
    });

    bool released = false;
    for (int i = 0; i < 2000 && !released; ++i) {
        released = cache_->Cancel("c");
        if (!released) {
            std::this_thread::sleep_for(1ms);
        }
    }
    waiter.join();
    cache_->Drain();

    EXPECT_TRUE(released);
    EXPECT_TRUE(cancelled.load());
    EXPECT_FALSE(memory_->Exists("c"));
    EXPECT_FALSE(disk_->Exists("c"));
    EXPECT_FALSE(cache_->Cancel("c"));
}

TEST_F(TieredCacheTest, BypassedRemoteIsNeitherReadNorWritten) {
    failover_->TriggerFailover("durable-store", DependencyKind::kDurableStore, "test");
    ASSERT_TRUE(flags_.RemoteBypassed());
    storage_->Seed("audio-cache/k", "remote-copy", clock_.Now());

    GetResult result = cache_->GetOrCreate("k", Counting("generated"));
    cache_->Drain();

    EXPECT_EQ(result.source, HitSource::kGenerated);
    EXPECT_EQ(storage_->heads(), 0);
    EXPECT_EQ(storage_->puts(), 0);
    EXPECT_TRUE(disk_->Exists("k"));
}

TEST_F(TieredCacheTest, UnreachableRemoteDoesNotFailTheCall) {
    DependencyHealthMonitor::Options monitor_opts;
    monitor_opts.failure_threshold = 10;
    DependencyHealthMonitor monitor(monitor_opts, metrics_);
    monitor.AddDependency("durable-store", DependencyKind::kDurableStore, [] { return ProbeResult::Success(); });
    cache_->AttachHealthMonitor(&monitor);

    storage_->SetUnavailable(true);
    GetResult result = cache_->GetOrCreate("k", Counting("X"));
    cache_->Drain();

    EXPECT_EQ(result.source, HitSource::kGenerated);
    EXPECT_TRUE(memory_->Exists("k"));
    EXPECT_EQ(cache_->Stats().remote_write_failures, 1u);
    EXPECT_GE(metrics_->Count("RemoteCacheError"), 1);

    // One failed read, one failed write.
    auto health = monitor.Get("durable-store");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->consecutive_failures, 2u);
    EXPECT_EQ(health->status, HealthStatus::kDegraded);
    cache_->AttachHealthMonitor(nullptr);
}

TEST_F(TieredCacheTest, WorksWithoutRemoteTier) {
    MakeManager(nullptr);
    EXPECT_EQ(cache_->GetOrCreate("k", Counting("X")).source, HitSource::kGenerated);
    cache_->Drain();
    EXPECT_EQ(storage_->puts(), 0);
}

TEST_F(TieredCacheTest, InvalidateRemovesFromEveryTier) {
    cache_->GetOrCreate("k", Counting("X"));
    cache_->Drain();
    cache_->Invalidate("k");

    EXPECT_FALSE(memory_->Exists("k"));
    EXPECT_FALSE(disk_->Exists("k"));
    EXPECT_FALSE(storage_->Contains("audio-cache/k"));
    EXPECT_EQ(cache_->GetOrCreate("k", Counting("Y")).source, HitSource::kGenerated);
}

TEST_F(TieredCacheTest, StatsTrackHitsAndMisses) {
    cache_->GetOrCreate("a", Counting("1"));
    cache_->GetOrCreate("a", Counting("1"));
    cache_->GetOrCreate("a", Counting("1"));
    cache_->GetOrCreate("b", Counting("2"));

    CacheStatsSnapshot stats = cache_->Stats();
    EXPECT_EQ(stats.total_requests, 4u);
    EXPECT_EQ(stats.memory_hits, 2u);
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_EQ(stats.generated, 2u);
    EXPECT_DOUBLE_EQ(stats.HitRate(), 50.0);
    EXPECT_EQ(stats.memory_entries, 2u);
    EXPECT_EQ(stats.memory_capacity, 10u);

    Json::Value json = stats.ToJson();
    EXPECT_EQ(json["stats"]["memoryHits"].asUInt64(), 2u);
    EXPECT_DOUBLE_EQ(json["hitRate"].asDouble(), 50.0);
    EXPECT_EQ(json["cacheSize"]["maxDisk"].asUInt64(), 10u);
    EXPECT_EQ(metrics_->Count("CacheMiss"), 2);
}

TEST_F(TieredCacheTest, SweepExpiredClearsMemoryAndDisk) {
    cache_->GetOrCreate("k", Counting("X"));
    clock_.Advance(25h);
    EXPECT_EQ(cache_->SweepExpired(), 2u);
    EXPECT_EQ(cache_->Stats().memory_entries, 0u);
    EXPECT_EQ(cache_->Stats().disk_entries, 0u);
}

TEST(TieredCacheConfigTest, RequiresMemoryAndDisk) {
    DegradedModeFlags flags;
    auto memory = std::make_shared<MemoryTier>(1, ExpiryTracker(1h));
    EXPECT_THROW(
        { TieredCacheManager cache(memory, nullptr, nullptr, flags, nullptr, TieredCacheManager::Options()); },
        ConfigurationError);
}
