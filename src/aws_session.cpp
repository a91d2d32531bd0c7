#include "audiocache/aws_session.hpp"
#include "aws_common.h"

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/LogLevel.h>

namespace audiocache {

struct AwsSession::Impl {
    Aws::SDKOptions aws_options;
};

AwsSession::AwsSession() : p_impl(std::make_unique<Impl>()) {
    p_impl->aws_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
    Aws::InitAPI(p_impl->aws_options);
}

AwsSession::~AwsSession() {
    Aws::ShutdownAPI(p_impl->aws_options);
}

Aws::Client::ClientConfiguration MakeClientConfig(const std::string& region, const std::string& endpoint) {
    Aws::Client::ClientConfiguration aws_cfg;
    if (!region.empty()) {
        aws_cfg.region = region;
    }
    if (!endpoint.empty()) {
        aws_cfg.endpointOverride = endpoint;
    }
    aws_cfg.connectTimeoutMs = 3000;
    aws_cfg.requestTimeoutMs = 10000;
    return aws_cfg;
}

std::optional<Aws::Auth::AWSCredentials> StaticCredentials(const Config& cfg) {
    if (cfg.aws_access_key_id.empty() || cfg.aws_secret_access_key.empty()) {
        return std::nullopt;
    }
    Aws::Auth::AWSCredentials creds;
    creds.SetAWSAccessKeyId(cfg.aws_access_key_id.c_str());
    creds.SetAWSSecretKey(cfg.aws_secret_access_key.c_str());
    return creds;
}

} // namespace audiocache
