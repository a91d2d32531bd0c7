#include "audiocache/cache_key.hpp"
#include "audiocache/disk_tier.hpp"
#include "audiocache/errors.hpp"
#include "audiocache/logging.hpp"
#include "audiocache/memory_tier.hpp"
#include "audiocache/tiered_cache.hpp"

#include <cxxopts.hpp>
#include <json/json.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace audiocache;

struct BenchConfig {
    int num_threads = 4;
    int num_requests = 1000;
    int num_phrases = 100;
    int memory_capacity = 50;
    int disk_capacity = 200;
    int payload_bytes = 16 * 1024;
    int synth_latency_ms = 20;
    double skew = 0.8;
    std::string cache_dir = "./cache/bench";
};

struct Stats {
    std::atomic<int> num_requests{0};
    std::atomic<int> num_generated{0};
    std::atomic<int> num_errors{0};
    std::atomic<double> hit_latency_ms{0.0};
    std::atomic<double> miss_latency_ms{0.0};
};

// Helper function to atomically add to a std::atomic<double>
// This is required for compilers that don't support fetch_add on double (pre-C++20)
void atomic_add_double(std::atomic<double>& atomic_double, double value) {
    double old_val = atomic_double.load();
    double new_val;
    do {
        new_val = old_val + value;
    } while (!atomic_double.compare_exchange_weak(old_val, new_val));
}

// Stands in for a synthesis call: sleeps, then returns deterministic bytes.
Generator make_synthetic_generator(const BenchConfig& cfg, std::atomic<int>& calls) {
    return [&cfg, &calls](const std::string& key, const CancellationToken& token) -> Bytes {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.synth_latency_ms));
        if (token.IsCancelled()) {
            throw GenerationCancelledError("cancelled: " + key);
        }
        Bytes payload(static_cast<std::size_t>(cfg.payload_bytes));
        std::mt19937 rng(static_cast<std::uint32_t>(std::hash<std::string>{}(key)));
        for (auto& b : payload) {
            b = static_cast<std::uint8_t>(rng());
        }
        return payload;
    };
}

// Picks a phrase with a hot set: `skew` of requests go to the first tenth.
int pick_phrase(const BenchConfig& cfg, std::mt19937& rng) {
    std::uniform_real_distribution<> hot_dist(0.0, 1.0);
    const int hot = std::max(1, cfg.num_phrases / 10);
    if (hot_dist(rng) < cfg.skew) {
        return std::uniform_int_distribution<int>(0, hot - 1)(rng);
    }
    return std::uniform_int_distribution<int>(0, cfg.num_phrases - 1)(rng);
}

void worker_thread(TieredCacheManager& cache,
                   const BenchConfig& cfg,
                   Stats& stats,
                   const std::vector<std::string>& keys,
                   const Generator& generator,
                   int thread_id) {
    std::mt19937 rng(thread_id);
    int requests_per_thread = cfg.num_requests / cfg.num_threads;

    for (int i = 0; i < requests_per_thread; ++i) {
        const auto& key = keys[pick_phrase(cfg, rng)];

        auto start = std::chrono::high_resolution_clock::now();
        try {
            GetResult result = cache.GetOrCreate(key, generator);
            auto end = std::chrono::high_resolution_clock::now();
            double ms = std::chrono::duration<double, std::milli>(end - start).count();
            if (result.source == HitSource::kGenerated) {
                stats.num_generated++;
                atomic_add_double(stats.miss_latency_ms, ms);
            } else {
                atomic_add_double(stats.hit_latency_ms, ms);
            }
        } catch (const std::exception&) {
            stats.num_errors++;
        }
        stats.num_requests++;
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("cachebench", "Benchmark tool for the tiered audio cache");
    options.add_options()
        ("t,threads", "Number of worker threads", cxxopts::value<int>()->default_value("4"))
        ("r,requests", "Total number of requests", cxxopts::value<int>()->default_value("1000"))
        ("p,phrases", "Distinct phrases in the workload", cxxopts::value<int>()->default_value("100"))
        ("m,memory-capacity", "Memory tier entries", cxxopts::value<int>()->default_value("50"))
        ("d,disk-capacity", "Disk tier entries", cxxopts::value<int>()->default_value("200"))
        ("payload-bytes", "Size of each synthetic clip", cxxopts::value<int>()->default_value("16384"))
        ("latency-ms", "Synthetic generation latency", cxxopts::value<int>()->default_value("20"))
        ("s,skew", "Share of requests hitting the hot tenth of phrases", cxxopts::value<double>()->default_value("0.8"))
        ("cache-dir", "Disk tier directory", cxxopts::value<std::string>()->default_value("./cache/bench"))
        ("keep", "Keep the disk tier from a previous run")
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      std::cout << options.help() << std::endl;
      exit(0);
    }

    BenchConfig cfg;
    cfg.num_threads = std::max(1, result["threads"].as<int>());
    cfg.num_requests = result["requests"].as<int>();
    cfg.num_phrases = std::max(1, result["phrases"].as<int>());
    cfg.memory_capacity = std::max(1, result["memory-capacity"].as<int>());
    cfg.disk_capacity = std::max(1, result["disk-capacity"].as<int>());
    cfg.payload_bytes = result["payload-bytes"].as<int>();
    cfg.synth_latency_ms = result["latency-ms"].as<int>();
    cfg.skew = result["skew"].as<double>();
    cfg.cache_dir = result["cache-dir"].as<std::string>();

    InitLogging("warn");

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Threads: " << cfg.num_threads << std::endl;
    std::cout << "Total Requests: " << cfg.num_requests << std::endl;
    std::cout << "Phrases: " << cfg.num_phrases << " (skew " << cfg.skew << ")" << std::endl;
    std::cout << "Capacity: memory " << cfg.memory_capacity << ", disk " << cfg.disk_capacity << std::endl;
    std::cout << "Synthetic clip: " << cfg.payload_bytes << " bytes, " << cfg.synth_latency_ms << " ms" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    if (!result.count("keep")) {
        std::error_code ec;
        std::filesystem::remove_all(cfg.cache_dir, ec);
    }

    std::vector<std::string> keys;
    for (int i = 0; i < cfg.num_phrases; ++i) {
        keys.push_back(DeriveCacheKeyHex("Benchmark alert number " + std::to_string(i), "Joanna", "mp3", "neural"));
    }

    ExpiryTracker expiry(std::chrono::hours(24));
    auto memory = std::make_shared<MemoryTier>(static_cast<std::size_t>(cfg.memory_capacity), expiry);
    auto disk = std::make_shared<DiskTier>(cfg.cache_dir, static_cast<std::size_t>(cfg.disk_capacity), expiry);
    DegradedModeFlags flags;

    TieredCacheManager::Options cache_opts;
    cache_opts.start_sweeper = false;
    TieredCacheManager cache(memory, disk, nullptr, flags, std::make_shared<NullMetricsRecorder>(), cache_opts);

    std::atomic<int> generator_calls{0};
    Generator generator = make_synthetic_generator(cfg, generator_calls);

    std::vector<std::thread> threads;
    std::vector<Stats> thread_stats(cfg.num_threads);

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker_thread, std::ref(cache), std::cref(cfg), std::ref(thread_stats[i]),
                             std::cref(keys), std::cref(generator), i);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();
    cache.Drain();

    Stats total_stats;
    for (const auto& s : thread_stats) {
        total_stats.num_requests += s.num_requests.load();
        total_stats.num_generated += s.num_generated.load();
        total_stats.num_errors += s.num_errors.load();
        atomic_add_double(total_stats.hit_latency_ms, s.hit_latency_ms.load());
        atomic_add_double(total_stats.miss_latency_ms, s.miss_latency_ms.load());
    }

    const int served = total_stats.num_requests - total_stats.num_errors;
    const int hits = served - total_stats.num_generated;
    double avg_hit_latency = (hits > 0) ? total_stats.hit_latency_ms.load() / hits : 0.0;
    double avg_miss_latency = (total_stats.num_generated > 0)
        ? total_stats.miss_latency_ms.load() / total_stats.num_generated : 0.0;
    double requests_per_sec = total_stats.num_requests / total_duration_s;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Requests per second: " << requests_per_sec << std::endl;
    std::cout << "Generator calls: " << generator_calls.load() << std::endl;
    std::cout << "Errors: " << total_stats.num_errors << std::endl;
    std::cout << "Avg. hit latency: " << avg_hit_latency << " ms" << std::endl;
    std::cout << "Avg. miss latency: " << avg_miss_latency << " ms" << std::endl;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, cache.Stats().ToJson()) << std::endl;
    std::cout << "-----------------------------" << std::endl;

    return 0;
}
