#pragma once

#include "expiry.hpp"
#include "providers.hpp"
#include "tier_store.hpp"

#include <atomic>
#include <memory>

namespace audiocache {

// Durable tier over an ObjectStorageProvider. Unbounded: the provider's own
// lifecycle rules clean it up. Expired objects read as misses but are never
// deleted from here.
class RemoteTier : public TierStore {
public:
    RemoteTier(std::shared_ptr<ObjectStorageProvider> storage,
               std::string prefix,
               ExpiryTracker expiry);

    std::optional<CacheEntry> Get(const std::string& key) override;
    bool Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) override;
    bool Exists(const std::string& key) override;
    void Remove(const std::string& key) override;
    // Objects written by this process; the store itself is not listed.
    std::size_t Size() const override { return written_.load(); }
    Tier tier() const override { return Tier::kRemote; }

    std::string ObjectKey(const std::string& key) const { return prefix_ + key; }

private:
    std::shared_ptr<ObjectStorageProvider> storage_;
    const std::string prefix_;
    const ExpiryTracker expiry_;
    std::atomic<std::size_t> written_{0};
};

} // namespace audiocache
