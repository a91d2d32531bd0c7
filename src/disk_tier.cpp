#include "audiocache/disk_tier.hpp"
#include "audiocache/errors.hpp"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace audiocache {

namespace {

constexpr char kPayloadExt[] = ".audio";
constexpr char kMetaExt[] = ".meta";
constexpr char kTempSuffix[] = ".tmp";

struct MetaRecord {
    std::int64_t timestamp;
    std::uint64_t size_bytes;
    std::string key;
};

// Keys become file names, so only a conservative character set is accepted.
bool valid_key(const std::string& key) {
    if (key.empty() || key.size() > 128 || key.front() == '.') return false;
    if (key.find("..") != std::string::npos) return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z') || c == '-' || c == '_' || c == '.';
    });
}

MetaRecord parse_meta(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CorruptionError("cannot open " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw CorruptionError("unparsable metadata " + path.string() + ": " + errs);
    }
    if (!root.isObject() || !root["timestamp"].isIntegral() ||
        !root["sizeBytes"].isIntegral() || !root["key"].isString()) {
        throw CorruptionError("incomplete metadata " + path.string());
    }
    return MetaRecord{root["timestamp"].asInt64(), root["sizeBytes"].asUInt64(),
                      root["key"].asString()};
}

std::string render_meta(const std::string& key, std::int64_t timestamp, std::uint64_t size) {
    Json::Value root;
    root["timestamp"] = Json::Int64(timestamp);
    root["sizeBytes"] = Json::UInt64(size);
    root["key"] = key;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

bool write_file(const fs::path& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    return static_cast<bool>(out);
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Disk tier could not remove {}: {}", path.string(), ec.message());
    }
}

} // namespace

DiskTier::DiskTier(fs::path directory, std::size_t capacity, ExpiryTracker expiry)
    : directory_(std::move(directory)), capacity_(capacity), expiry_(std::move(expiry)) {
    if (capacity_ == 0) {
        throw ConfigurationError("disk tier capacity must be at least 1");
    }
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw ConfigurationError("cannot create disk cache directory " + directory_.string() +
                                 ": " + ec.message());
    }
    load_index();
}

fs::path DiskTier::PayloadPath(const std::string& key) const {
    return directory_ / (key + kPayloadExt);
}

fs::path DiskTier::MetaPath(const std::string& key) const {
    return directory_ / (key + kMetaExt);
}

void DiskTier::load_index() {
    struct Found {
        std::string key;
        MetaRecord meta;
    };
    std::vector<Found> found;
    std::vector<fs::path> payloads;

    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        if (path.extension() == kTempSuffix) {
            // Left behind by an interrupted Put.
            remove_quietly(path);
            continue;
        }
        if (path.extension() == kPayloadExt) {
            payloads.push_back(path);
            continue;
        }
        if (path.extension() != kMetaExt) {
            continue;
        }
        const std::string key = path.stem().string();
        try {
            MetaRecord meta = parse_meta(path);
            if (meta.key != key || !valid_key(key)) {
                throw CorruptionError("metadata key mismatch in " + path.string());
            }
            if (!fs::exists(PayloadPath(key))) {
                spdlog::warn("Disk tier dropping {}: payload missing", key);
                remove_quietly(path);
                continue;
            }
            found.push_back(Found{key, meta});
        } catch (const CorruptionError& e) {
            spdlog::warn("Disk tier dropping corrupt entry: {}", e.what());
            remove_quietly(path);
            remove_quietly(PayloadPath(key));
        }
    }
    if (ec) {
        spdlog::error("Disk tier scan of {} failed: {}", directory_.string(), ec.message());
    }

    std::unordered_set<std::string> indexed;
    for (const auto& f : found) {
        indexed.insert(f.key);
    }
    for (const auto& path : payloads) {
        std::error_code exists_ec;
        if (!indexed.count(path.stem().string()) && fs::exists(path, exists_ec)) {
            spdlog::warn("Disk tier dropping {}: metadata missing", path.filename().string());
            remove_quietly(path);
        }
    }

    std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
        return a.meta.timestamp < b.meta.timestamp;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& f : found) {
        index_[f.key] = IndexEntry{f.meta.size_bytes, f.meta.timestamp};
        lru_.Touch(f.key);
    }
    while (index_.size() > capacity_) {
        auto victim = lru_.Evict();
        if (!victim) break;
        erase_locked(*victim);
    }
    spdlog::info("Loaded {} disk cache entries from {}", index_.size(), directory_.string());
}

void DiskTier::erase_locked(const std::string& key) {
    index_.erase(key);
    lru_.Remove(key);
    remove_quietly(PayloadPath(key));
    remove_quietly(MetaPath(key));
}

std::optional<CacheEntry> DiskTier::Get(const std::string& key) {
    std::uint64_t expected_size = 0;
    std::int64_t created_at = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        if (expiry_.IsExpired(it->second.created_at_ms)) {
            erase_locked(key);
            return std::nullopt;
        }
        expected_size = it->second.size_bytes;
        created_at = it->second.created_at_ms;
    }

    Bytes payload;
    try {
        std::ifstream in(PayloadPath(key), std::ios::binary);
        if (!in) {
            throw CorruptionError("payload missing for " + key);
        }
        payload.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (payload.size() != expected_size) {
            throw CorruptionError("payload size mismatch for " + key);
        }
    } catch (const CorruptionError& e) {
        spdlog::warn("Disk tier dropping entry: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end() && it->second.created_at_ms == created_at) {
            erase_locked(key);
        }
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (lru_.Contains(key)) {
        lru_.Touch(key);
    }

    CacheEntry entry;
    entry.key = key;
    entry.payload = std::move(payload);
    entry.created_at_ms = created_at;
    entry.size_bytes = expected_size;
    entry.tier = Tier::kDisk;
    return entry;
}

bool DiskTier::Put(const std::string& key, bytes_view payload, const EntryMetadata& meta) {
    if (!valid_key(key)) {
        spdlog::warn("Disk tier rejected key '{}'", key);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (index_.find(key) == index_.end()) {
        while (index_.size() >= capacity_) {
            auto victim = lru_.Evict();
            if (!victim) break;
            spdlog::debug("Disk tier evicted {}", *victim);
            erase_locked(*victim);
        }
    }

    const fs::path payload_path = PayloadPath(key);
    const fs::path meta_path = MetaPath(key);
    const fs::path payload_tmp = payload_path.string() + kTempSuffix;
    const fs::path meta_tmp = meta_path.string() + kTempSuffix;
    const std::string meta_text = render_meta(key, meta.created_at_ms, payload.size());

    if (!write_file(payload_tmp, payload.data(), payload.size()) ||
        !write_file(meta_tmp, reinterpret_cast<const std::uint8_t*>(meta_text.data()),
                    meta_text.size())) {
        spdlog::error("Disk cache write error for {}", key);
        remove_quietly(payload_tmp);
        remove_quietly(meta_tmp);
        return false;
    }

    std::error_code ec;
    fs::rename(payload_tmp, payload_path, ec);
    if (!ec) {
        fs::rename(meta_tmp, meta_path, ec);
    }
    if (ec) {
        spdlog::error("Disk cache rename failed for {}: {}", key, ec.message());
        remove_quietly(payload_tmp);
        remove_quietly(meta_tmp);
        erase_locked(key);
        return false;
    }

    index_[key] = IndexEntry{payload.size(), meta.created_at_ms};
    lru_.Touch(key);
    return true;
}

bool DiskTier::Exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end() || expiry_.IsExpired(it->second.created_at_ms)) {
        return false;
    }
    std::error_code ec;
    return fs::exists(PayloadPath(key), ec) && fs::exists(MetaPath(key), ec);
}

void DiskTier::Remove(const std::string& key) {
    if (!valid_key(key)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(key);
}

std::size_t DiskTier::SweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> expired;
    for (const auto& kv : index_) {
        if (expiry_.IsExpired(kv.second.created_at_ms)) {
            expired.push_back(kv.first);
        }
    }
    for (const auto& key : expired) {
        erase_locked(key);
    }
    return expired.size();
}

std::size_t DiskTier::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace audiocache
