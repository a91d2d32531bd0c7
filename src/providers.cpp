#include "audiocache/providers.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace audiocache {

void LogMetricsRecorder::Record(const std::string& name, double value, const std::string& unit,
                                const MetricTags& tags) noexcept {
    try {
        std::string rendered;
        for (const auto& tag : tags) {
            rendered += " " + tag.first + "=" + tag.second;
        }
        spdlog::debug("metric {}={} {}{}", name, value, unit, rendered);
    } catch (const std::exception&) {
        // Metrics never reach the caller's error path.
    }
}

bool LogNotificationChannel::Publish(const std::string& subject, const std::string& message) {
    spdlog::warn("ALERT {}: {}", subject, message);
    return true;
}

} // namespace audiocache
