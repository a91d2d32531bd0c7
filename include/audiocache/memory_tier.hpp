#pragma once

#include "expiry.hpp"
#include "lru.hpp"
#include "tier_store.hpp"

#include <mutex>
#include <unordered_map>

namespace audiocache {

// Bounded in-process tier. Capacity counts entries.
class MemoryTier : public TierStore {
public:
    MemoryTier(std::size_t capacity, ExpiryTracker expiry);

    std::optional<CacheEntry> Get(const std::string& key) override;
    bool Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) override;
    bool Exists(const std::string& key) override;
    void Remove(const std::string& key) override;
    std::size_t SweepExpired() override;
    std::size_t Size() const override;
    std::size_t Capacity() const override { return capacity_; }
    Tier tier() const override { return Tier::kMemory; }

private:
    struct Slot {
        Bytes payload;
        std::int64_t created_at_ms;
    };

    void erase_locked(const std::string& key);

    const std::size_t capacity_;
    const ExpiryTracker expiry_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    LRUTracker lru_;
};

} // namespace audiocache
