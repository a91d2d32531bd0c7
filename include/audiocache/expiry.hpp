#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace audiocache {

class TierStore;

// Milliseconds since the Unix epoch.
using ClockFn = std::function<std::int64_t()>;

std::int64_t SystemNowMs();

/**
 * @class ExpiryTracker
 * @brief TTL policy shared by the tiers.
 *
 * An entry is valid while now - created_at < ttl. The clock is injectable so
 * tests can move time without sleeping.
 */
class ExpiryTracker {
public:
    explicit ExpiryTracker(std::chrono::milliseconds ttl, ClockFn clock = SystemNowMs);

    bool IsExpired(std::int64_t created_at_ms) const;
    std::int64_t NowMs() const { return clock_(); }
    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    std::chrono::milliseconds ttl_;
    ClockFn clock_;
};

/**
 * @class ExpirySweeper
 * @brief Background thread that periodically calls SweepExpired() on a set of
 * tiers, independent of foreground reads and writes.
 *
 * The tiers must outlive the sweeper.
 */
class ExpirySweeper {
public:
    ExpirySweeper(std::vector<TierStore*> tiers, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    void Start();
    void Stop();

    // One pass over every tier; returns the number of entries dropped.
    std::size_t SweepOnce();

private:
    void SweepLoop();

    std::vector<TierStore*> tiers_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;
};

} // namespace audiocache
