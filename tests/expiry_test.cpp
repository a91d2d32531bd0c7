#include "audiocache/expiry.hpp"
#include "audiocache/memory_tier.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace audiocache;
using namespace std::chrono_literals;

TEST(ExpiryTrackerTest, ExpiresAtExactlyTtl) {
    fakes::ManualClock clock;
    ExpiryTracker expiry(1000ms, clock.Fn());
    const std::int64_t created = clock.Now();

    EXPECT_FALSE(expiry.IsExpired(created));
    clock.Advance(999ms);
    EXPECT_FALSE(expiry.IsExpired(created));
    clock.Advance(1ms);
    EXPECT_TRUE(expiry.IsExpired(created));
    EXPECT_EQ(expiry.ttl(), 1000ms);
}

TEST(ExpiryTrackerTest, UsesSystemClockByDefault) {
    ExpiryTracker expiry(std::chrono::hours(24));
    EXPECT_FALSE(expiry.IsExpired(SystemNowMs()));
    EXPECT_TRUE(expiry.IsExpired(SystemNowMs() - std::chrono::milliseconds(std::chrono::hours(25)).count()));
}

TEST(ExpirySweeperTest, SweepOnceCoversEveryTier) {
    fakes::ManualClock clock;
    MemoryTier a(4, ExpiryTracker(100ms, clock.Fn()));
    MemoryTier b(4, ExpiryTracker(100ms, clock.Fn()));
    a.Put("x", ToBytes("1"), EntryMetadata{clock.Now()});
    b.Put("y", ToBytes("2"), EntryMetadata{clock.Now()});
    b.Put("z", ToBytes("3"), EntryMetadata{clock.Now() + 1000});

    ExpirySweeper sweeper({&a, &b}, std::chrono::hours(1));
    EXPECT_EQ(sweeper.SweepOnce(), 0u);
    clock.Advance(200ms);
    EXPECT_EQ(sweeper.SweepOnce(), 2u);
    EXPECT_EQ(a.Size(), 0u);
    EXPECT_EQ(b.Size(), 1u);
}

TEST(ExpirySweeperTest, BackgroundThreadSweepsAndStops) {
    fakes::ManualClock clock;
    MemoryTier tier(4, ExpiryTracker(100ms, clock.Fn()));
    tier.Put("x", ToBytes("1"), EntryMetadata{clock.Now()});
    clock.Advance(200ms);

    ExpirySweeper sweeper({&tier}, 10ms);
    sweeper.Start();
    for (int i = 0; i < 200 && tier.Size() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    sweeper.Stop();
    EXPECT_EQ(tier.Size(), 0u);
}

TEST(ExpiryTrackerTest, RejectsNonPositiveTtl) {
    EXPECT_THROW({ ExpiryTracker expiry(0ms); }, ConfigurationError);
    EXPECT_THROW({ ExpiryTracker expiry(-5ms); }, ConfigurationError);
}
