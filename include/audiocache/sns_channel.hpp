#pragma once

#include "providers.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace audiocache {

// NotificationChannel publishing to an SNS topic.
class SnsNotificationChannel : public NotificationChannel {
public:
    SnsNotificationChannel(const Config& cfg, const std::string& topic_arn);
    ~SnsNotificationChannel() override;

    bool Publish(const std::string& subject, const std::string& message) override;

private:
    struct SnsImpl;
    std::unique_ptr<SnsImpl> p_impl;
};

} // namespace audiocache
