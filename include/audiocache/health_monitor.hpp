#pragma once

#include "expiry.hpp"
#include "providers.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace audiocache {

enum class DependencyKind {
    kSynthesis,
    kDurableStore,
    kEdgeDelivery,
    kOther,
};

enum class HealthStatus {
    kHealthy,
    kDegraded,
    kFailed,
};

const char* DependencyKindName(DependencyKind kind);
const char* HealthStatusName(HealthStatus status);

struct ProbeResult {
    bool healthy = false;
    std::chrono::milliseconds latency{0};
    std::string error;

    static ProbeResult Success(std::chrono::milliseconds latency = std::chrono::milliseconds(0)) {
        return ProbeResult{true, latency, {}};
    }
    static ProbeResult Failure(std::string error) {
        return ProbeResult{false, std::chrono::milliseconds(0), std::move(error)};
    }
};

using ProbeFn = std::function<ProbeResult()>;

struct DependencyHealth {
    std::string name;
    DependencyKind kind = DependencyKind::kOther;
    std::uint32_t consecutive_failures = 0;
    HealthStatus status = HealthStatus::kHealthy;
    std::int64_t last_checked_ms = 0;
    std::chrono::milliseconds last_latency{0};
    std::string last_error;
};

// Typed health events. Called outside the monitor's locks, on the thread that
// recorded the result.
class HealthObserver {
public:
    virtual ~HealthObserver() = default;
    // Exactly once per entry into Failed.
    virtual void OnDependencyFailed(const DependencyHealth& health) = 0;
    // After a Failed episode, once the configured number of successes is seen.
    virtual void OnDependencyRecovered(const DependencyHealth& health) = 0;
};

/**
 * @class DependencyHealthMonitor
 * @brief Per-dependency probes, failure counters and status.
 *
 * Each dependency gets its own probe thread and schedule. A probe that runs
 * past probe_timeout counts as a failure, and no new probe starts until it
 * returns. Dependencies must be added before
 * Start(); observers must outlive the monitor.
 */
class DependencyHealthMonitor {
public:
    struct Options {
        std::chrono::milliseconds probe_interval = std::chrono::minutes(1);
        std::chrono::milliseconds probe_timeout = std::chrono::seconds(5);
        std::uint32_t failure_threshold = 3;
        std::uint32_t recovery_successes = 1;
        ClockFn clock = SystemNowMs;
    };

    DependencyHealthMonitor(Options options, std::shared_ptr<MetricsRecorder> metrics);
    ~DependencyHealthMonitor();

    void AddDependency(const std::string& name, DependencyKind kind, ProbeFn probe);
    void AddObserver(HealthObserver* observer);

    void Start();
    void Stop();

    // Runs one probe for `name` on the calling thread and applies the result.
    DependencyHealth RunProbe(const std::string& name);

    // Applies an externally observed result, e.g. a failed remote read.
    // Results for one dependency are applied and reported one at a time.
    DependencyHealth RecordResult(const std::string& name, const ProbeResult& result);

    // One probe per dependency; returns true when all were healthy.
    bool ProbeAll();

    bool Tracks(const std::string& name) const;
    std::optional<DependencyHealth> Get(const std::string& name) const;
    std::vector<DependencyHealth> Snapshot() const;
    Json::Value StatusJson() const;

private:
    struct Tracked;

    Tracked& tracked(const std::string& name) const;
    ProbeResult run_with_timeout(Tracked& dep);
    void probe_loop(Tracked* dep);

    Options options_;
    std::shared_ptr<MetricsRecorder> metrics_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<Tracked>> deps_;
    std::vector<HealthObserver*> observers_;
    bool running_ = false;

    DependencyHealthMonitor(const DependencyHealthMonitor&) = delete;
    DependencyHealthMonitor& operator=(const DependencyHealthMonitor&) = delete;
};

} // namespace audiocache
