#pragma once

#include "span_compat.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace audiocache {

// Remote text-to-speech capability. Throws TransientDependencyError when the
// service is unreachable and FatalDependencyError when it rejects the request.
class SpeechSynthesisProvider {
public:
    virtual ~SpeechSynthesisProvider() = default;
    virtual Bytes Synthesize(const SynthesisRequest& request) = 0;
    virtual std::string name() const = 0;
};

struct StoredObject {
    Bytes data;
    std::int64_t last_modified_ms = 0;
};

struct ObjectMetadata {
    std::string content_type = "audio/mpeg";
    std::string cache_control = "max-age=86400";
    std::map<std::string, std::string> user_metadata;
};

// Durable object store. NotFound is std::nullopt (or false from Delete);
// an unreachable store throws TransientDependencyError.
class ObjectStorageProvider {
public:
    virtual ~ObjectStorageProvider() = default;
    virtual std::optional<StoredObject> Get(const std::string& key) = 0;
    virtual bool Put(const std::string& key, bytes_view data, const ObjectMetadata& meta) = 0;
    virtual std::optional<std::int64_t> HeadMetadata(const std::string& key) = 0;
    virtual bool Delete(const std::string& key) = 0;
};

// CDN in front of the object store. Failures are never fatal.
class EdgeDeliveryProvider {
public:
    virtual ~EdgeDeliveryProvider() = default;
    virtual bool Invalidate(const std::string& path) = 0;
    virtual bool IsReachable() = 0;
    virtual std::string UrlFor(const std::string& path) const = 0;
};

using MetricTags = std::map<std::string, std::string>;

// Fire-and-forget; implementations must not block the caller or throw.
class MetricsRecorder {
public:
    virtual ~MetricsRecorder() = default;
    virtual void Record(const std::string& name, double value, const std::string& unit,
                        const MetricTags& tags = {}) noexcept = 0;
};

// Best-effort alert channel; returns false on failure.
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;
    virtual bool Publish(const std::string& subject, const std::string& message) = 0;
};

class NullMetricsRecorder : public MetricsRecorder {
public:
    void Record(const std::string&, double, const std::string&, const MetricTags&) noexcept override {}
};

// Writes metrics at debug level to the default spdlog logger.
class LogMetricsRecorder : public MetricsRecorder {
public:
    void Record(const std::string& name, double value, const std::string& unit,
                const MetricTags& tags) noexcept override;
};

// Used when no alert topic is configured: the alert only reaches the log.
class LogNotificationChannel : public NotificationChannel {
public:
    bool Publish(const std::string& subject, const std::string& message) override;
};

} // namespace audiocache
