#pragma once

#include "span_compat.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace audiocache {

// Storage layers, fastest first.
enum class Tier {
    kMemory = 0,
    kDisk = 1,
    kRemote = 2,
};

// Where a GetOrCreate result came from.
enum class HitSource {
    kMemory,
    kDisk,
    kRemote,
    kGenerated,
};

const char* TierName(Tier tier);
const char* HitSourceName(HitSource source);
HitSource HitSourceFor(Tier tier);

struct EntryMetadata {
    std::int64_t created_at_ms = 0;
};

struct CacheEntry {
    std::string key;
    Bytes payload;
    std::int64_t created_at_ms = 0;
    std::uint64_t size_bytes = 0;
    Tier tier = Tier::kMemory;
};

struct SynthesisRequest {
    std::string text;
    std::string voice_id = "Joanna";
    std::string format = "mp3";
    std::string engine = "neural";
};

struct Config {
    std::string service_name = "SafetyAlertSystem";
    std::string environment = "production";
    // Region for alerting and metrics clients.
    std::string aws_region;

    // Cache tiers
    std::size_t memory_capacity = 50;
    std::size_t disk_capacity = 200;
    std::string disk_cache_dir = "./cache/audio";
    std::string remote_prefix = "audio-cache/";
    std::chrono::milliseconds ttl = std::chrono::hours(24);
    std::chrono::milliseconds sweep_interval = std::chrono::hours(1);
    std::chrono::milliseconds generation_timeout = std::chrono::seconds(30);

    // Health monitoring
    std::chrono::milliseconds probe_interval = std::chrono::minutes(1);
    std::chrono::milliseconds probe_timeout = std::chrono::seconds(5);
    std::uint32_t failure_threshold = 3;
    std::uint32_t recovery_successes = 1;

    // S3 Configuration
    std::string s3_endpoint;
    std::string s3_region;
    std::string s3_bucket;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    bool s3_use_path_style = false;

    // Synthesis
    std::string polly_region;
    std::string polly_fallback_region;

    // Alerts and delivery
    std::string sns_topic_arn;
    std::string edge_domain;
    std::string edge_distribution_id;
};

} // namespace audiocache
