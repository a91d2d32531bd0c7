#include "audiocache/lru.hpp"

namespace audiocache {

void LRUTracker::Touch(const std::string& key) {
    auto it = key_map_.find(key);
    if (it != key_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }
    lru_list_.push_front(key);
    key_map_[key] = lru_list_.begin();
}

void LRUTracker::Remove(const std::string& key) {
    auto it = key_map_.find(key);
    if (it == key_map_.end()) {
        return;
    }
    lru_list_.erase(it->second);
    key_map_.erase(it);
}

std::optional<std::string> LRUTracker::Evict() {
    if (lru_list_.empty()) {
        return std::nullopt;
    }
    std::string victim = std::move(lru_list_.back());
    lru_list_.pop_back();
    key_map_.erase(victim);
    return victim;
}

bool LRUTracker::Contains(const std::string& key) const {
    return key_map_.count(key) != 0;
}

bool LRUTracker::IsEmpty() const {
    return key_map_.empty();
}

size_t LRUTracker::Size() const {
    return key_map_.size();
}

} // namespace audiocache
