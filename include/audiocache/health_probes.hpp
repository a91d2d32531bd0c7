#pragma once

#include "health_monitor.hpp"
#include "providers.hpp"

#include <memory>
#include <string>

namespace audiocache {

// Real probes against the collaborators. Each one times the call and turns
// any exception into a failed ProbeResult.

// Synthesizes a short phrase.
ProbeFn MakeSynthesisProbe(std::shared_ptr<SpeechSynthesisProvider> provider);

// Reads metadata of `probe_key`; NotFound still proves the store answers.
ProbeFn MakeStorageProbe(std::shared_ptr<ObjectStorageProvider> storage,
                         std::string probe_key = "health-check");

ProbeFn MakeEdgeProbe(std::shared_ptr<EdgeDeliveryProvider> edge);

} // namespace audiocache
