#pragma once

#include "degraded_mode.hpp"
#include "providers.hpp"
#include "tiered_cache.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace audiocache {

struct SynthesisOptions {
    std::string format = "mp3";
    std::string engine = "neural";
    std::chrono::milliseconds timeout{0};  // 0: the cache's default
};

struct AudioResult {
    Bytes payload;
    HitSource source = HitSource::kGenerated;
    std::string key;
    std::string object_name;  // "<key>.<format>", the name in every tier
    bool from_cache = false;
    std::string delivery_url;  // empty when no delivery endpoint is configured
};

struct WarmupReport {
    std::size_t requested = 0;
    std::size_t generated = 0;
    std::size_t cached = 0;
    std::size_t failed = 0;
};

/**
 * @class AlertAudioService
 * @brief Speech for alert messages, served through the tiered cache.
 *
 * Picks the synthesis provider from the current SynthesisMode, refuses to
 * synthesize in cache-only mode, and invalidates the edge copy of freshly
 * generated audio unless the edge is bypassed.
 */
class AlertAudioService {
public:
    struct Options {
        std::string remote_prefix = "audio-cache/";
        // Base URL of the object store, used when the edge is bypassed.
        std::string direct_base_url;
    };

    AlertAudioService(TieredCacheManager& cache,
                      const DegradedModeFlags& flags,
                      std::shared_ptr<SpeechSynthesisProvider> primary,
                      std::shared_ptr<SpeechSynthesisProvider> alternate,
                      std::shared_ptr<EdgeDeliveryProvider> edge,
                      Options options);

    AudioResult GetAudio(const std::string& text,
                         const std::string& voice_id = "Joanna",
                         const SynthesisOptions& options = SynthesisOptions());

    // Drops cached audio for the request from every tier and the edge.
    void Invalidate(const std::string& text,
                    const std::string& voice_id = "Joanna",
                    const SynthesisOptions& options = SynthesisOptions());

    WarmupReport WarmCommonAlerts();
    WarmupReport WarmCommonAlerts(const std::vector<std::string>& alerts,
                                  const std::vector<std::string>& voices);

    static const std::vector<std::string>& CommonAlerts();
    static const std::vector<std::string>& CommonVoices();

    static std::string ObjectName(const std::string& key, const std::string& format);

    // Edge path of the stored object, e.g. "/audio-cache/<key>.mp3".
    std::string DeliveryPath(const std::string& key, const std::string& format) const;

private:
    Generator make_generator(const SynthesisRequest& request) const;
    std::string path_for(const std::string& object_name) const;
    std::string delivery_url(const std::string& object_name) const;
    void invalidate_edge(const std::string& object_name) const;

    TieredCacheManager& cache_;
    const DegradedModeFlags& flags_;
    std::shared_ptr<SpeechSynthesisProvider> primary_;
    std::shared_ptr<SpeechSynthesisProvider> alternate_;
    std::shared_ptr<EdgeDeliveryProvider> edge_;
    Options options_;
};

} // namespace audiocache
