#include "audiocache/audio_service.hpp"
#include "audiocache/aws_session.hpp"
#include "audiocache/cloudfront_edge.hpp"
#include "audiocache/cloudwatch_metrics.hpp"
#include "audiocache/disk_tier.hpp"
#include "audiocache/failover.hpp"
#include "audiocache/health_monitor.hpp"
#include "audiocache/health_probes.hpp"
#include "audiocache/logging.hpp"
#include "audiocache/memory_tier.hpp"
#include "audiocache/polly_provider.hpp"
#include "audiocache/remote_tier.hpp"
#include "audiocache/s3_storage.hpp"
#include "audiocache/settings.hpp"
#include "audiocache/sns_channel.hpp"
#include "audiocache/tiered_cache.hpp"

#include <cxxopts.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace audiocache;

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

int run(const cxxopts::ParseResult& result) {
    Config cfg;
    ApplyEnvDefaults(cfg);
    if (result.count("cache-dir")) {
        cfg.disk_cache_dir = result["cache-dir"].as<std::string>();
    }
    if (result.count("memory-capacity")) {
        cfg.memory_capacity = result["memory-capacity"].as<std::size_t>();
    }
    if (result.count("disk-capacity")) {
        cfg.disk_capacity = result["disk-capacity"].as<std::size_t>();
    }
    ValidateConfig(cfg);

    AwsSession aws;

    std::shared_ptr<MetricsRecorder> metrics = std::make_shared<CloudWatchMetricsRecorder>(cfg);
    std::shared_ptr<NotificationChannel> notifier;
    if (cfg.sns_topic_arn.empty()) {
        spdlog::warn("No alert topic configured; failover alerts go to the log only");
        notifier = std::make_shared<LogNotificationChannel>();
    } else {
        notifier = std::make_shared<SnsNotificationChannel>(cfg, cfg.sns_topic_arn);
    }

    auto primary = std::make_shared<PollySynthesisProvider>(cfg, cfg.polly_region);
    auto alternate = std::make_shared<PollySynthesisProvider>(cfg, cfg.polly_fallback_region);
    auto storage = std::make_shared<S3ObjectStorage>(cfg);
    std::shared_ptr<EdgeDeliveryProvider> edge;
    if (!cfg.edge_domain.empty()) {
        edge = std::make_shared<CloudFrontEdgeDelivery>(cfg);
    }

    ExpiryTracker expiry(cfg.ttl);
    auto memory = std::make_shared<MemoryTier>(cfg.memory_capacity, expiry);
    auto disk = std::make_shared<DiskTier>(cfg.disk_cache_dir, cfg.disk_capacity, expiry);
    auto remote = std::make_shared<RemoteTier>(storage, cfg.remote_prefix, expiry);

    DegradedModeFlags flags;

    FailoverController::Options failover_opts;
    failover_opts.service_name = cfg.service_name;
    FailoverController failover(flags, notifier, metrics, failover_opts);
    failover.SetAlternateSynthesis(alternate);

    DependencyHealthMonitor::Options monitor_opts;
    monitor_opts.probe_interval = cfg.probe_interval;
    monitor_opts.probe_timeout = cfg.probe_timeout;
    monitor_opts.failure_threshold = cfg.failure_threshold;
    monitor_opts.recovery_successes = cfg.recovery_successes;
    DependencyHealthMonitor monitor(monitor_opts, metrics);
    monitor.AddDependency("synthesis", DependencyKind::kSynthesis, MakeSynthesisProbe(primary));
    monitor.AddDependency("durable-store", DependencyKind::kDurableStore, MakeStorageProbe(storage));
    if (edge) {
        monitor.AddDependency("edge-delivery", DependencyKind::kEdgeDelivery, MakeEdgeProbe(edge));
    }
    monitor.AddObserver(&failover);

    TieredCacheManager::Options cache_opts;
    cache_opts.default_timeout = cfg.generation_timeout;
    cache_opts.sweep_interval = cfg.sweep_interval;
    TieredCacheManager cache(memory, disk, remote, flags, metrics, cache_opts);
    cache.AttachHealthMonitor(&monitor);

    AlertAudioService::Options service_opts;
    service_opts.remote_prefix = cfg.remote_prefix;
    service_opts.direct_base_url = storage->BaseUrl();
    AlertAudioService service(cache, flags, primary, alternate, edge, service_opts);

    spdlog::info("Audio cache ready: memory {} entries, disk {} entries at {}, bucket {}",
                 cfg.memory_capacity, cfg.disk_capacity, cfg.disk_cache_dir, cfg.s3_bucket);

    int rc = 0;

    if (result.count("status")) {
        const bool healthy = monitor.ProbeAll();
        Json::Value status = monitor.StatusJson();
        status["overall"] = healthy ? "healthy" : "degraded";
        status["mode"] = flags.Describe();
        printJson(status);
        if (!healthy) {
            rc = 3;
        }
    }

    if (result.count("warm")) {
        WarmupReport report = service.WarmCommonAlerts();
        std::cout << "Pre-cached " << report.requested << " alerts: " << report.generated << " generated, "
                  << report.cached << " already cached, " << report.failed << " failed" << std::endl;
        if (report.failed > 0) {
            rc = 1;
        }
    }

    if (result.count("text")) {
        const std::string text = result["text"].as<std::string>();
        const std::string voice = result["voice"].as<std::string>();
        SynthesisOptions synth;
        synth.format = result["format"].as<std::string>();
        synth.engine = result["engine"].as<std::string>();

        if (result.count("invalidate")) {
            service.Invalidate(text, voice, synth);
            std::cout << "Invalidated cached audio for \"" << text << "\" (" << voice << ")" << std::endl;
        } else {
            AudioResult audio = service.GetAudio(text, voice, synth);
            std::cout << "Key:    " << audio.key << std::endl;
            std::cout << "Object: " << audio.object_name << std::endl;
            std::cout << "Source: " << HitSourceName(audio.source) << std::endl;
            std::cout << "Bytes:  " << audio.payload.size() << std::endl;
            if (!audio.delivery_url.empty()) {
                std::cout << "URL:    " << audio.delivery_url << std::endl;
            }
            if (result.count("output")) {
                const std::string path = result["output"].as<std::string>();
                std::ofstream out(path, std::ios::binary | std::ios::trunc);
                out.write(reinterpret_cast<const char*>(audio.payload.data()),
                          static_cast<std::streamsize>(audio.payload.size()));
                if (!out) {
                    spdlog::error("Failed to write audio to {}", path);
                    rc = 1;
                }
            }
        }
    }

    const int monitor_seconds = result["monitor-seconds"].as<int>();
    if (monitor_seconds > 0) {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        monitor.Start();
        spdlog::info("Monitoring dependencies for {} s (Ctrl+C to stop)", monitor_seconds);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(monitor_seconds);
        while (g_running && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        monitor.Stop();
        spdlog::info("Operating mode: {}", flags.Describe());
    }

    cache.Drain();
    if (result.count("stats")) {
        printJson(cache.Stats().ToJson());
    }
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("alertcache", "Cached speech for safety alerts");
    options.add_options()
        ("t,text", "Alert text to speak", cxxopts::value<std::string>())
        ("v,voice", "Voice id", cxxopts::value<std::string>()->default_value("Joanna"))
        ("f,format", "Output audio format", cxxopts::value<std::string>()->default_value("mp3"))
        ("e,engine", "Synthesis engine", cxxopts::value<std::string>()->default_value("neural"))
        ("o,output", "Write the audio to this file", cxxopts::value<std::string>())
        ("invalidate", "Drop cached audio for --text instead of fetching it")
        ("w,warm", "Pre-cache the common alerts in the common voices")
        ("s,stats", "Print cache statistics as JSON")
        ("status", "Probe every dependency and print health as JSON")
        ("cache-dir", "Disk tier directory", cxxopts::value<std::string>())
        ("memory-capacity", "Memory tier entry limit", cxxopts::value<std::size_t>())
        ("disk-capacity", "Disk tier entry limit", cxxopts::value<std::size_t>())
        ("monitor-seconds", "Run background health probes for this long",
         cxxopts::value<int>()->default_value("0"))
        ("log-level", "trace, debug, info, warn, error", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also log to this rotating file", cxxopts::value<std::string>()->default_value(""))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        InitLogging(result["log-level"].as<std::string>(), result["log-file"].as<std::string>());
        return run(result);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
