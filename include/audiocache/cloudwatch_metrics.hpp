#pragma once

#include "providers.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace audiocache {

// MetricsRecorder that publishes each value asynchronously to CloudWatch
// under the service name namespace. Environment and Region dimensions are
// added to every datum.
class CloudWatchMetricsRecorder : public MetricsRecorder {
public:
    explicit CloudWatchMetricsRecorder(const Config& cfg);
    ~CloudWatchMetricsRecorder() override;

    void Record(const std::string& name, double value, const std::string& unit,
                const MetricTags& tags) noexcept override;

private:
    struct CloudWatchImpl;
    std::unique_ptr<CloudWatchImpl> p_impl;
};

} // namespace audiocache
