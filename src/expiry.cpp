#include "audiocache/expiry.hpp"
#include "audiocache/errors.hpp"
#include "audiocache/tier_store.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace audiocache {

std::int64_t SystemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

ExpiryTracker::ExpiryTracker(std::chrono::milliseconds ttl, ClockFn clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (ttl_.count() <= 0) {
        throw ConfigurationError("ttl must be positive");
    }
}

bool ExpiryTracker::IsExpired(std::int64_t created_at_ms) const {
    return clock_() - created_at_ms >= ttl_.count();
}

ExpirySweeper::ExpirySweeper(std::vector<TierStore*> tiers, std::chrono::milliseconds interval)
    : tiers_(std::move(tiers)), interval_(interval) {}

ExpirySweeper::~ExpirySweeper() {
    Stop();
}

void ExpirySweeper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stop_ = false;
    thread_ = std::thread(&ExpirySweeper::SweepLoop, this);
}

void ExpirySweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t ExpirySweeper::SweepOnce() {
    std::size_t removed = 0;
    for (TierStore* tier : tiers_) {
        try {
            removed += tier->SweepExpired();
        } catch (const std::exception& e) {
            spdlog::warn("Expiry sweep failed on {} tier: {}", TierName(tier->tier()), e.what());
        }
    }
    if (removed > 0) {
        spdlog::info("Cache cleanup removed {} expired entries", removed);
    }
    return removed;
}

void ExpirySweeper::SweepLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return stop_; });
            if (stop_) {
                break;
            }
        }
        // Tier locks are taken one tier at a time, outside our own mutex.
        SweepOnce();
    }
}

} // namespace audiocache
