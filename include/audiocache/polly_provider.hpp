#pragma once

#include "providers.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace audiocache {

// SpeechSynthesisProvider over Amazon Polly in one region. Requires a live
// AwsSession.
class PollySynthesisProvider : public SpeechSynthesisProvider {
public:
    PollySynthesisProvider(const Config& cfg, const std::string& region);
    ~PollySynthesisProvider() override;

    Bytes Synthesize(const SynthesisRequest& request) override;
    std::string name() const override;

private:
    struct PollyImpl;
    std::unique_ptr<PollyImpl> p_impl;
};

} // namespace audiocache
