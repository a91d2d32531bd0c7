#include "audiocache/sns_channel.hpp"
#include "aws_common.h"

#include <aws/sns/SNSClient.h>
#include <aws/sns/model/PublishRequest.h>
#include <spdlog/spdlog.h>

namespace audiocache {

namespace {
// SNS rejects longer subjects.
constexpr std::size_t kMaxSubjectLength = 100;
} // namespace

struct SnsNotificationChannel::SnsImpl {
    std::unique_ptr<Aws::SNS::SNSClient> sns;
    std::string topic_arn;
};

SnsNotificationChannel::SnsNotificationChannel(const Config& cfg, const std::string& topic_arn)
    : p_impl(std::make_unique<SnsImpl>()) {
    if (topic_arn.empty()) {
        throw ConfigurationError("an SNS topic ARN is required");
    }
    Aws::Client::ClientConfiguration aws_cfg = MakeClientConfig(cfg.aws_region);
    if (auto creds = StaticCredentials(cfg)) {
        p_impl->sns = std::make_unique<Aws::SNS::SNSClient>(*creds, aws_cfg);
    } else {
        p_impl->sns = std::make_unique<Aws::SNS::SNSClient>(aws_cfg);
    }
    p_impl->topic_arn = topic_arn;
}

SnsNotificationChannel::~SnsNotificationChannel() = default;

bool SnsNotificationChannel::Publish(const std::string& subject, const std::string& message) {
    Aws::SNS::Model::PublishRequest request;
    request.SetTopicArn(p_impl->topic_arn);
    request.SetSubject(subject.substr(0, kMaxSubjectLength));
    request.SetMessage(message);

    auto outcome = p_impl->sns->Publish(request);
    if (!outcome.IsSuccess()) {
        spdlog::error("{}", DescribeError("SNS Publish", outcome.GetError()));
        return false;
    }
    return true;
}

} // namespace audiocache
