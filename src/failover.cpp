#include "audiocache/failover.hpp"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace audiocache {

FailoverController::FailoverController(DegradedModeFlags& flags,
                                       std::shared_ptr<NotificationChannel> notifier,
                                       std::shared_ptr<MetricsRecorder> metrics,
                                       Options options)
    : flags_(flags),
      notifier_(std::move(notifier)),
      metrics_(std::move(metrics)),
      options_(std::move(options)) {
    if (!notifier_) {
        notifier_ = std::make_shared<LogNotificationChannel>();
    }
    if (!metrics_) {
        metrics_ = std::make_shared<NullMetricsRecorder>();
    }
}

void FailoverController::SetAlternateSynthesis(std::shared_ptr<SpeechSynthesisProvider> alternate) {
    std::lock_guard<std::mutex> lock(mutex_);
    alternate_ = std::move(alternate);
}

void FailoverController::OnDependencyFailed(const DependencyHealth& health) {
    TriggerFailover(health.name, health.kind, health.last_error);
}

void FailoverController::OnDependencyRecovered(const DependencyHealth& health) {
    if (!options_.auto_recover) {
        spdlog::info("{} recovered; degraded mode kept until manual restore", health.name);
        return;
    }
    Restore(health.kind);
}

FailoverAction FailoverController::fail_over_synthesis() {
    FailoverAction action;
    action.kind = DependencyKind::kSynthesis;

    if (alternate_) {
        SynthesisRequest test;
        test.text = "Failover test";
        test.engine = "standard";
        try {
            alternate_->Synthesize(test);
            flags_.set_synthesis_mode(SynthesisMode::kAlternate);
            action.mode = "alternate_provider";
            action.fallback_ok = true;
            spdlog::info("Synthesis failover successful to {}", alternate_->name());
            return action;
        } catch (const std::exception& e) {
            spdlog::error("Synthesis failover to {} failed: {}", alternate_->name(), e.what());
        }
    }

    flags_.set_synthesis_mode(SynthesisMode::kCacheOnly);
    action.mode = "cache_only";
    return action;
}

FailoverAction FailoverController::TriggerFailover(const std::string& name,
                                                   DependencyKind kind,
                                                   const std::string& reason) {
    FailoverAction action;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        spdlog::warn("Triggering failover for {} ({}): {}", name, DependencyKindName(kind), reason);

        switch (kind) {
            case DependencyKind::kSynthesis:
                action = fail_over_synthesis();
                break;
            case DependencyKind::kDurableStore:
                flags_.set_remote_bypassed(true);
                action = FailoverAction{kind, "memory_disk_only", true};
                break;
            case DependencyKind::kEdgeDelivery:
                flags_.set_edge_bypassed(true);
                action = FailoverAction{kind, "direct_delivery", true};
                break;
            case DependencyKind::kOther:
                action = FailoverAction{kind, "none", false};
                break;
        }
        ++failovers_;
        spdlog::warn("Operating mode now: {}", flags_.Describe());
    }

    send_alert(name, reason, action);
    metrics_->Record("ServiceFailover", 1.0, "Count", {{"ServiceName", name}});
    return action;
}

void FailoverController::Restore(DependencyKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
        case DependencyKind::kSynthesis:
            flags_.set_synthesis_mode(SynthesisMode::kPrimary);
            break;
        case DependencyKind::kDurableStore:
            flags_.set_remote_bypassed(false);
            break;
        case DependencyKind::kEdgeDelivery:
            flags_.set_edge_bypassed(false);
            break;
        case DependencyKind::kOther:
            return;
    }
    spdlog::info("Restored {} to normal mode; operating mode now: {}",
                 DependencyKindName(kind), flags_.Describe());
}

void FailoverController::send_alert(const std::string& name,
                                    const std::string& reason,
                                    const FailoverAction& action) {
    Json::Value message;
    message["service"] = name;
    message["kind"] = DependencyKindName(action.kind);
    message["error"] = reason;
    message["timestamp"] = Json::Int64(options_.clock());
    message["failoverTriggered"] = true;
    message["mode"] = action.mode;
    message["fallbackSucceeded"] = action.fallback_ok;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::string subject = options_.service_name + " - Service Failover: " + name;

    try {
        if (!notifier_->Publish(subject, Json::writeString(builder, message))) {
            spdlog::error("Failover alert for {} was not delivered", name);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error sending failover alert for {}: {}", name, e.what());
    }
}

} // namespace audiocache
