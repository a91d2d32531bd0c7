#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <cstdlib>
#include <string>

namespace audiocache {

namespace defaults {
    constexpr char kRegion[] = "ap-south-1";
    constexpr char kFallbackRegion[] = "us-east-1";
    constexpr char kBucket[] = "safety-alert-audio-cache";
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Unset or unparsable variables keep the default.
inline std::uint64_t GetEnvUint(const char* name, std::uint64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value || !*value) return defaultValue;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0') return defaultValue;
    return static_cast<std::uint64_t>(parsed);
}

// Fills empty connection fields from AUDIOCACHE_* variables, and lets the
// variables override the numeric cache settings.
inline void ApplyEnvDefaults(Config& cfg) {
    if (cfg.aws_region.empty())
        cfg.aws_region = GetEnv("AUDIOCACHE_AWS_REGION", defaults::kRegion);
    cfg.environment = GetEnv("AUDIOCACHE_ENVIRONMENT", cfg.environment);
    if (cfg.s3_endpoint.empty())
        cfg.s3_endpoint = GetEnv("AUDIOCACHE_S3_ENDPOINT", "");
    if (cfg.s3_region.empty())
        cfg.s3_region = GetEnv("AUDIOCACHE_S3_REGION", defaults::kRegion);
    if (cfg.s3_bucket.empty())
        cfg.s3_bucket = GetEnv("AUDIOCACHE_S3_BUCKET", defaults::kBucket);
    if (cfg.aws_access_key_id.empty())
        cfg.aws_access_key_id = GetEnv("AUDIOCACHE_AWS_ACCESS_KEY_ID", "");
    if (cfg.aws_secret_access_key.empty())
        cfg.aws_secret_access_key = GetEnv("AUDIOCACHE_AWS_SECRET_ACCESS_KEY", "");
    cfg.s3_use_path_style = GetEnvBool("AUDIOCACHE_S3_USE_PATH_STYLE", cfg.s3_use_path_style);

    if (cfg.polly_region.empty())
        cfg.polly_region = GetEnv("AUDIOCACHE_POLLY_REGION", defaults::kRegion);
    if (cfg.polly_fallback_region.empty())
        cfg.polly_fallback_region = GetEnv("AUDIOCACHE_POLLY_FALLBACK_REGION", defaults::kFallbackRegion);

    if (cfg.sns_topic_arn.empty())
        cfg.sns_topic_arn = GetEnv("AUDIOCACHE_SNS_TOPIC_ARN", "");
    if (cfg.edge_domain.empty())
        cfg.edge_domain = GetEnv("AUDIOCACHE_EDGE_DOMAIN", "");
    if (cfg.edge_distribution_id.empty())
        cfg.edge_distribution_id = GetEnv("AUDIOCACHE_EDGE_DISTRIBUTION_ID", "");

    cfg.disk_cache_dir = GetEnv("AUDIOCACHE_DISK_DIR", cfg.disk_cache_dir);
    cfg.memory_capacity = GetEnvUint("AUDIOCACHE_MEMORY_CAPACITY", cfg.memory_capacity);
    cfg.disk_capacity = GetEnvUint("AUDIOCACHE_DISK_CAPACITY", cfg.disk_capacity);
    cfg.ttl = std::chrono::milliseconds(
        GetEnvUint("AUDIOCACHE_TTL_MS", static_cast<std::uint64_t>(cfg.ttl.count())));
    cfg.failure_threshold = static_cast<std::uint32_t>(
        GetEnvUint("AUDIOCACHE_FAILURE_THRESHOLD", cfg.failure_threshold));
}

// Throws ConfigurationError; callers treat it as fatal at startup.
inline void ValidateConfig(const Config& cfg) {
    if (cfg.ttl.count() <= 0)
        throw ConfigurationError("ttl must be positive");
    if (cfg.memory_capacity == 0)
        throw ConfigurationError("memory_capacity must be at least 1");
    if (cfg.disk_capacity == 0)
        throw ConfigurationError("disk_capacity must be at least 1");
    if (cfg.disk_cache_dir.empty())
        throw ConfigurationError("disk_cache_dir must not be empty");
    if (cfg.sweep_interval.count() <= 0)
        throw ConfigurationError("sweep_interval must be positive");
    if (cfg.generation_timeout.count() <= 0)
        throw ConfigurationError("generation_timeout must be positive");
    if (cfg.probe_interval.count() <= 0 || cfg.probe_timeout.count() <= 0)
        throw ConfigurationError("probe_interval and probe_timeout must be positive");
    if (cfg.failure_threshold == 0)
        throw ConfigurationError("failure_threshold must be at least 1");
    if (cfg.recovery_successes == 0)
        throw ConfigurationError("recovery_successes must be at least 1");
}

} // namespace audiocache
