#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace audiocache {

/**
 * @class LRUTracker
 * @brief Recency order of the keys held by one cache tier.
 *
 * Not thread-safe; the owning tier guards it with its own mutex.
 *
 * The front of the list is the most recently used key and the back is the
 * least recently used one. Recency moves on access, not only on insertion,
 * so eviction is true LRU rather than FIFO.
 */
class LRUTracker {
public:
    LRUTracker() = default;

    /**
     * @brief Marks a key as most recently used, inserting it if absent.
     * @param key The key to touch.
     */
    void Touch(const std::string& key);

    /**
     * @brief Forgets a key. Unknown keys are ignored.
     * @param key The key to remove.
     */
    void Remove(const std::string& key);

    /**
     * @brief Removes and returns the least recently used key.
     * @return The evicted key, or std::nullopt if the tracker is empty.
     */
    std::optional<std::string> Evict();

    bool Contains(const std::string& key) const;
    bool IsEmpty() const;
    size_t Size() const;

private:
    std::list<std::string> lru_list_;
    std::unordered_map<std::string, std::list<std::string>::iterator> key_map_;
};

} // namespace audiocache
