#include "audiocache/memory_tier.hpp"
#include "audiocache/errors.hpp"

#include <spdlog/spdlog.h>

namespace audiocache {

MemoryTier::MemoryTier(std::size_t capacity, ExpiryTracker expiry)
    : capacity_(capacity), expiry_(std::move(expiry)) {
    if (capacity_ == 0) {
        throw ConfigurationError("memory tier capacity must be at least 1");
    }
}

void MemoryTier::erase_locked(const std::string& key) {
    slots_.erase(key);
    lru_.Remove(key);
}

std::optional<CacheEntry> MemoryTier::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    if (expiry_.IsExpired(it->second.created_at_ms)) {
        erase_locked(key);
        return std::nullopt;
    }
    lru_.Touch(key);

    CacheEntry entry;
    entry.key = key;
    entry.payload = it->second.payload;
    entry.created_at_ms = it->second.created_at_ms;
    entry.size_bytes = it->second.payload.size();
    entry.tier = Tier::kMemory;
    return entry;
}

bool MemoryTier::Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(key);
    if (it != slots_.end()) {
        it->second.payload = payload.to_bytes();
        it->second.created_at_ms = meta.created_at_ms;
        lru_.Touch(key);
        return true;
    }

    // Make room before inserting so occupancy never exceeds capacity.
    while (slots_.size() >= capacity_) {
        auto victim = lru_.Evict();
        if (!victim) {
            break;
        }
        slots_.erase(*victim);
        spdlog::debug("Memory tier evicted {}", *victim);
    }

    slots_.emplace(key, Slot{payload.to_bytes(), meta.created_at_ms});
    lru_.Touch(key);
    return true;
}

bool MemoryTier::Exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    return it != slots_.end() && !expiry_.IsExpired(it->second.created_at_ms);
}

void MemoryTier::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(key);
}

std::size_t MemoryTier::SweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (expiry_.IsExpired(it->second.created_at_ms)) {
            lru_.Remove(it->first);
            it = slots_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MemoryTier::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace audiocache
