#include "audiocache/remote_tier.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace audiocache;
using namespace std::chrono_literals;

class RemoteTierTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<fakes::FakeObjectStorage>(clock_.Fn());
        tier_ = std::make_unique<RemoteTier>(storage_, "audio-cache/", ExpiryTracker(1000ms, clock_.Fn()));
    }

    fakes::ManualClock clock_;
    std::shared_ptr<fakes::FakeObjectStorage> storage_;
    std::unique_ptr<RemoteTier> tier_;
};

TEST_F(RemoteTierTest, PutStoresUnderPrefixWithMetadata) {
    ASSERT_TRUE(tier_->Put("k1", ToBytes("clip"), EntryMetadata{clock_.Now()}));

    EXPECT_TRUE(storage_->Contains("audio-cache/k1"));
    auto meta = storage_->MetadataOf("audio-cache/k1");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->content_type, "audio/mpeg");
    EXPECT_EQ(meta->user_metadata.at("cacheKey"), "k1");
    EXPECT_EQ(meta->user_metadata.at("cachedAt"), std::to_string(clock_.Now()));
    EXPECT_EQ(tier_->Size(), 1u);
    EXPECT_EQ(tier_->Capacity(), 0u);
}

TEST_F(RemoteTierTest, GetReturnsFreshObject) {
    tier_->Put("k1", ToBytes("clip"), EntryMetadata{clock_.Now()});
    clock_.Advance(500ms);

    auto entry = tier_->Get("k1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(ToString(entry->payload), "clip");
    EXPECT_EQ(entry->tier, Tier::kRemote);
    EXPECT_TRUE(tier_->Exists("k1"));
}

TEST_F(RemoteTierTest, MissingObjectIsAMiss) {
    EXPECT_FALSE(tier_->Get("absent").has_value());
    EXPECT_EQ(storage_->gets(), 0);
}

TEST_F(RemoteTierTest, ExpiredObjectIsAMissWithoutDownloadOrDelete) {
    storage_->Seed("audio-cache/old", "stale", clock_.Now() - 5000);

    EXPECT_FALSE(tier_->Get("old").has_value());
    EXPECT_FALSE(tier_->Exists("old"));
    EXPECT_EQ(storage_->gets(), 0);
    EXPECT_TRUE(storage_->Contains("audio-cache/old"));
}

TEST_F(RemoteTierTest, UnreachableStorePropagatesTransientError) {
    storage_->SetUnavailable(true);
    EXPECT_THROW(tier_->Get("k1"), TransientDependencyError);
    EXPECT_THROW(tier_->Put("k1", ToBytes("x"), EntryMetadata{clock_.Now()}), TransientDependencyError);
    EXPECT_EQ(tier_->Size(), 0u);
}

TEST_F(RemoteTierTest, RemoveDeletesObject) {
    tier_->Put("k1", ToBytes("clip"), EntryMetadata{clock_.Now()});
    tier_->Remove("k1");
    EXPECT_FALSE(storage_->Contains("audio-cache/k1"));
    tier_->Remove("k1");
}
