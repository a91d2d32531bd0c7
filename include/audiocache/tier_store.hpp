#pragma once

#include "span_compat.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace audiocache {

// Uniform get/put contract shared by the memory, disk and remote tiers.
// A miss, expired entry included, is std::nullopt; only an unreachable
// backend throws (TransientDependencyError).
class TierStore {
public:
    virtual ~TierStore() = default;

    virtual std::optional<CacheEntry> Get(const std::string& key) = 0;
    virtual bool Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) = 0;
    virtual bool Exists(const std::string& key) = 0;
    virtual void Remove(const std::string& key) = 0;

    // Drops expired entries; returns how many went.
    virtual std::size_t SweepExpired() { return 0; }

    virtual std::size_t Size() const = 0;
    // Maximum entry count; 0 means unbounded.
    virtual std::size_t Capacity() const { return 0; }
    virtual Tier tier() const = 0;
};

} // namespace audiocache
