#pragma once

#include "expiry.hpp"
#include "lru.hpp"
#include "tier_store.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_map>

namespace audiocache {

/**
 * @class DiskTier
 * @brief Local persistent tier.
 *
 * Each entry is two files in one directory: `<key>.audio` holds the payload
 * and `<key>.meta` holds `{"timestamp": epoch-ms, "sizeBytes": n, "key": k}`.
 * A missing file on either side is a miss. The constructor rebuilds the
 * recency index from the metadata files alone, oldest timestamp least recent.
 *
 * Index and file mutations are serialized by one mutex; payload reads happen
 * outside it.
 */
class DiskTier : public TierStore {
public:
    DiskTier(std::filesystem::path directory, std::size_t capacity, ExpiryTracker expiry);

    std::optional<CacheEntry> Get(const std::string& key) override;
    bool Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) override;
    bool Exists(const std::string& key) override;
    void Remove(const std::string& key) override;
    std::size_t SweepExpired() override;
    std::size_t Size() const override;
    std::size_t Capacity() const override { return capacity_; }
    Tier tier() const override { return Tier::kDisk; }

    const std::filesystem::path& directory() const { return directory_; }

    std::filesystem::path PayloadPath(const std::string& key) const;
    std::filesystem::path MetaPath(const std::string& key) const;

private:
    struct IndexEntry {
        std::uint64_t size_bytes;
        std::int64_t created_at_ms;
    };

    void load_index();
    void erase_locked(const std::string& key);

    const std::filesystem::path directory_;
    const std::size_t capacity_;
    const ExpiryTracker expiry_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, IndexEntry> index_;
    LRUTracker lru_;
};

} // namespace audiocache
