#include "audiocache/audio_service.hpp"
#include "audiocache/cache_key.hpp"
#include "audiocache/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace audiocache {

AlertAudioService::AlertAudioService(TieredCacheManager& cache,
                                     const DegradedModeFlags& flags,
                                     std::shared_ptr<SpeechSynthesisProvider> primary,
                                     std::shared_ptr<SpeechSynthesisProvider> alternate,
                                     std::shared_ptr<EdgeDeliveryProvider> edge,
                                     Options options)
    : cache_(cache),
      flags_(flags),
      primary_(std::move(primary)),
      alternate_(std::move(alternate)),
      edge_(std::move(edge)),
      options_(std::move(options)) {
    if (!primary_) {
        throw ConfigurationError("a primary synthesis provider is required");
    }
}

const std::vector<std::string>& AlertAudioService::CommonAlerts() {
    static const std::vector<std::string> alerts = {
        "Emergency alert activated",
        "Weather warning issued",
        "Traffic alert in your area",
        "System maintenance notification",
        "Alert acknowledged",
        "Emergency services contacted",
    };
    return alerts;
}

const std::vector<std::string>& AlertAudioService::CommonVoices() {
    static const std::vector<std::string> voices = {"Joanna", "Matthew", "Amy"};
    return voices;
}

std::string AlertAudioService::ObjectName(const std::string& key, const std::string& format) {
    return key + "." + format;
}

std::string AlertAudioService::path_for(const std::string& object_name) const {
    return "/" + options_.remote_prefix + object_name;
}

std::string AlertAudioService::DeliveryPath(const std::string& key, const std::string& format) const {
    return path_for(ObjectName(key, format));
}

Generator AlertAudioService::make_generator(const SynthesisRequest& request) const {
    // Runs on a generation thread that may outlive this call.
    const DegradedModeFlags& flags = flags_;
    auto primary = primary_;
    auto alternate = alternate_;
    return [&flags, primary, alternate, request](const std::string& key, const CancellationToken& token) -> Bytes {
        std::shared_ptr<SpeechSynthesisProvider> provider = primary;
        switch (flags.synthesis_mode()) {
            case SynthesisMode::kCacheOnly:
                throw GenerationDisabledError("synthesis disabled (cache-only mode), no cached audio for " + key);
            case SynthesisMode::kAlternate:
                if (alternate) {
                    provider = alternate;
                }
                break;
            case SynthesisMode::kPrimary:
                break;
        }
        if (token.IsCancelled()) {
            throw GenerationCancelledError("generation cancelled for " + key);
        }

        Bytes audio = provider->Synthesize(request);
        if (audio.empty()) {
            throw FatalDependencyError(provider->name() + " returned no audio for " + key);
        }
        return audio;
    };
}

std::string AlertAudioService::delivery_url(const std::string& object_name) const {
    const std::string path = path_for(object_name);
    if (edge_ && !flags_.EdgeBypassed()) {
        return edge_->UrlFor(path);
    }
    if (!options_.direct_base_url.empty()) {
        return options_.direct_base_url + path;
    }
    return {};
}

void AlertAudioService::invalidate_edge(const std::string& object_name) const {
    if (!edge_ || flags_.EdgeBypassed()) {
        return;
    }
    const std::string path = path_for(object_name);
    try {
        if (!edge_->Invalidate(path)) {
            spdlog::warn("Edge invalidation failed for {}", path);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Edge invalidation failed for {}: {}", path, e.what());
    }
}

AudioResult AlertAudioService::GetAudio(const std::string& text,
                                        const std::string& voice_id,
                                        const SynthesisOptions& options) {
    SynthesisRequest request;
    request.text = text;
    request.voice_id = voice_id;
    request.format = options.format;
    request.engine = options.engine;

    const std::string key = DeriveCacheKeyHex(text, voice_id, options.format, options.engine);
    const std::string object_name = ObjectName(key, options.format);
    GetResult got = cache_.GetOrCreate(object_name, make_generator(request), options.timeout);

    AudioResult result;
    result.payload = std::move(got.payload);
    result.source = got.source;
    result.key = key;
    result.object_name = object_name;
    result.from_cache = got.source != HitSource::kGenerated;
    result.delivery_url = delivery_url(object_name);

    if (!result.from_cache && !flags_.RemoteBypassed()) {
        invalidate_edge(object_name);
    }
    spdlog::debug("Audio for \"{}\" ({}) served from {}", text.substr(0, 30), voice_id,
                  HitSourceName(result.source));
    return result;
}

void AlertAudioService::Invalidate(const std::string& text,
                                   const std::string& voice_id,
                                   const SynthesisOptions& options) {
    const std::string object_name =
        ObjectName(DeriveCacheKeyHex(text, voice_id, options.format, options.engine), options.format);
    cache_.Invalidate(object_name);
    invalidate_edge(object_name);
}

WarmupReport AlertAudioService::WarmCommonAlerts() {
    return WarmCommonAlerts(CommonAlerts(), CommonVoices());
}

WarmupReport AlertAudioService::WarmCommonAlerts(const std::vector<std::string>& alerts,
                                                 const std::vector<std::string>& voices) {
    spdlog::info("Pre-caching {} common alerts in {} voices", alerts.size(), voices.size());
    WarmupReport report;
    for (const auto& alert : alerts) {
        for (const auto& voice : voices) {
            ++report.requested;
            try {
                AudioResult result = GetAudio(alert, voice);
                if (result.from_cache) {
                    ++report.cached;
                } else {
                    ++report.generated;
                }
            } catch (const std::exception& e) {
                ++report.failed;
                spdlog::error("Pre-cache failed for \"{}\" with {}: {}", alert, voice, e.what());
            }
        }
    }
    spdlog::info("Pre-caching completed: {} generated, {} already cached, {} failed",
                 report.generated, report.cached, report.failed);
    return report;
}

} // namespace audiocache
