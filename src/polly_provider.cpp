#include "audiocache/polly_provider.hpp"
#include "aws_common.h"

#include <aws/polly/PollyClient.h>
#include <aws/polly/model/Engine.h>
#include <aws/polly/model/OutputFormat.h>
#include <aws/polly/model/SynthesizeSpeechRequest.h>
#include <aws/polly/model/VoiceId.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace audiocache {

struct PollySynthesisProvider::PollyImpl {
    std::unique_ptr<Aws::Polly::PollyClient> polly;
    std::string region;
};

PollySynthesisProvider::PollySynthesisProvider(const Config& cfg, const std::string& region)
    : p_impl(std::make_unique<PollyImpl>()) {
    Aws::Client::ClientConfiguration aws_cfg = MakeClientConfig(region);
    if (auto creds = StaticCredentials(cfg)) {
        p_impl->polly = std::make_unique<Aws::Polly::PollyClient>(*creds, aws_cfg);
    } else {
        p_impl->polly = std::make_unique<Aws::Polly::PollyClient>(aws_cfg);
    }
    p_impl->region = region;
}

PollySynthesisProvider::~PollySynthesisProvider() = default;

std::string PollySynthesisProvider::name() const {
    return "polly:" + p_impl->region;
}

Bytes PollySynthesisProvider::Synthesize(const SynthesisRequest& req) {
    using namespace Aws::Polly::Model;

    SynthesizeSpeechRequest request;
    request.SetText(req.text);
    request.SetVoiceId(VoiceIdMapper::GetVoiceIdForName(req.voice_id));
    request.SetOutputFormat(OutputFormatMapper::GetOutputFormatForName(req.format));
    request.SetEngine(EngineMapper::GetEngineForName(req.engine));

    auto outcome = p_impl->polly->SynthesizeSpeech(request);
    if (!outcome.IsSuccess()) {
        ThrowForError("SynthesizeSpeech (" + name() + ")", outcome.GetError());
    }

    auto& audio = outcome.GetResult().GetAudioStream();
    std::stringstream ss;
    ss << audio.rdbuf();
    std::string s = ss.str();
    spdlog::debug("{} synthesized {} bytes for voice {}", name(), s.size(), req.voice_id);
    return Bytes(s.begin(), s.end());
}

} // namespace audiocache
