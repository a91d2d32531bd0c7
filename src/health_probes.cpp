#include "audiocache/health_probes.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace audiocache {

namespace {

template <typename Fn>
ProbeResult timed(Fn&& fn) {
    const auto start = std::chrono::steady_clock::now();
    try {
        if (!fn()) {
            return ProbeResult::Failure("dependency reported unhealthy");
        }
    } catch (const std::exception& e) {
        return ProbeResult::Failure(e.what());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    // Keep a non-zero latency so the monitor does not re-measure.
    return ProbeResult::Success(std::max(elapsed, std::chrono::milliseconds(1)));
}

} // namespace

ProbeFn MakeSynthesisProbe(std::shared_ptr<SpeechSynthesisProvider> provider) {
    return [provider] {
        return timed([&provider] {
            SynthesisRequest request;
            request.text = "Health check";
            request.engine = "standard";
            return !provider->Synthesize(request).empty();
        });
    };
}

ProbeFn MakeStorageProbe(std::shared_ptr<ObjectStorageProvider> storage, std::string probe_key) {
    return [storage, probe_key] {
        return timed([&storage, &probe_key] {
            static_cast<void>(storage->HeadMetadata(probe_key));
            return true;
        });
    };
}

ProbeFn MakeEdgeProbe(std::shared_ptr<EdgeDeliveryProvider> edge) {
    return [edge] {
        return timed([&edge] { return edge->IsReachable(); });
    };
}

} // namespace audiocache
