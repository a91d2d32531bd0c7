#pragma once

#include "degraded_mode.hpp"
#include "expiry.hpp"
#include "health_monitor.hpp"
#include "providers.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace audiocache {

struct FailoverAction {
    DependencyKind kind = DependencyKind::kOther;
    std::string mode;            // installed operating mode, "none" if nothing changed
    bool fallback_ok = false;    // the preferred fallback worked
};

/**
 * @class FailoverController
 * @brief Turns "dependency entered Failed" into a degraded operating mode.
 *
 * Strategy by dependency kind:
 *  - synthesis: test the alternate provider once; use it if it answers,
 *    otherwise disable generation and serve from cache only.
 *  - durable store: bypass the remote tier.
 *  - edge delivery: bypass the edge and serve the tier directly.
 * Each failover installs its flag and publishes one alert.
 *
 * With auto_recover set, a recovery event from the monitor clears the flag
 * for that dependency kind; otherwise only Restore() does.
 */
class FailoverController : public HealthObserver {
public:
    struct Options {
        std::string service_name = "SafetyAlertSystem";
        bool auto_recover = true;
        ClockFn clock = SystemNowMs;
    };

    FailoverController(DegradedModeFlags& flags,
                       std::shared_ptr<NotificationChannel> notifier,
                       std::shared_ptr<MetricsRecorder> metrics,
                       Options options);

    void SetAlternateSynthesis(std::shared_ptr<SpeechSynthesisProvider> alternate);

    void OnDependencyFailed(const DependencyHealth& health) override;
    void OnDependencyRecovered(const DependencyHealth& health) override;

    // Also the manual failover entry point.
    FailoverAction TriggerFailover(const std::string& name, DependencyKind kind, const std::string& reason);

    // Returns the dependency kind to normal mode.
    void Restore(DependencyKind kind);

    std::uint64_t failover_count() const { return failovers_.load(); }

private:
    FailoverAction fail_over_synthesis();
    void send_alert(const std::string& name, const std::string& reason, const FailoverAction& action);

    DegradedModeFlags& flags_;
    std::shared_ptr<NotificationChannel> notifier_;
    std::shared_ptr<MetricsRecorder> metrics_;
    Options options_;

    std::mutex mutex_;  // serializes flag writes
    std::shared_ptr<SpeechSynthesisProvider> alternate_;
    std::atomic<std::uint64_t> failovers_{0};
};

} // namespace audiocache
