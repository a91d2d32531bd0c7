#include "audiocache/remote_tier.hpp"

#include <spdlog/spdlog.h>

namespace audiocache {

namespace {

// Content type from a "<key>.<format>" name; audio/mpeg when there is none.
std::string content_type_for(const std::string& key) {
    const std::size_t dot = key.rfind('.');
    if (dot == std::string::npos) {
        return "audio/mpeg";
    }
    const std::string format = key.substr(dot + 1);
    if (format == "ogg_vorbis") return "audio/ogg";
    if (format == "pcm") return "audio/pcm";
    return "audio/mpeg";
}

} // namespace

RemoteTier::RemoteTier(std::shared_ptr<ObjectStorageProvider> storage,
                       std::string prefix,
                       ExpiryTracker expiry)
    : storage_(std::move(storage)), prefix_(std::move(prefix)), expiry_(std::move(expiry)) {}

std::optional<CacheEntry> RemoteTier::Get(const std::string& key) {
    const std::string object_key = ObjectKey(key);

    // Metadata first, so an expired object costs no payload transfer.
    std::optional<std::int64_t> last_modified = storage_->HeadMetadata(object_key);
    if (!last_modified) {
        return std::nullopt;
    }
    if (expiry_.IsExpired(*last_modified)) {
        spdlog::debug("Remote cache expired for {}", key);
        return std::nullopt;
    }

    std::optional<StoredObject> object = storage_->Get(object_key);
    if (!object) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.key = key;
    entry.created_at_ms = object->last_modified_ms;
    entry.size_bytes = object->data.size();
    entry.payload = std::move(object->data);
    entry.tier = Tier::kRemote;
    return entry;
}

bool RemoteTier::Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) {
    ObjectMetadata object_meta;
    object_meta.content_type = content_type_for(key);
    object_meta.user_metadata["cacheKey"] = key;
    object_meta.user_metadata["cachedAt"] = std::to_string(meta.created_at_ms);

    if (!storage_->Put(ObjectKey(key), payload, object_meta)) {
        return false;
    }
    ++written_;
    return true;
}

bool RemoteTier::Exists(const std::string& key) {
    std::optional<std::int64_t> last_modified = storage_->HeadMetadata(ObjectKey(key));
    return last_modified && !expiry_.IsExpired(*last_modified);
}

void RemoteTier::Remove(const std::string& key) {
    if (!storage_->Delete(ObjectKey(key))) {
        spdlog::warn("Remote cache delete failed for {}", key);
    }
}

} // namespace audiocache
