#include "audiocache/cloudwatch_metrics.hpp"
#include "aws_common.h"

#include <aws/core/utils/DateTime.h>
#include <aws/monitoring/CloudWatchClient.h>
#include <aws/monitoring/model/Dimension.h>
#include <aws/monitoring/model/MetricDatum.h>
#include <aws/monitoring/model/PutMetricDataRequest.h>
#include <aws/monitoring/model/StandardUnit.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace audiocache {

struct CloudWatchMetricsRecorder::CloudWatchImpl {
    std::unique_ptr<Aws::CloudWatch::CloudWatchClient> cloudwatch;
    std::string metric_namespace;
    std::string environment;
    std::string region;
};

CloudWatchMetricsRecorder::CloudWatchMetricsRecorder(const Config& cfg)
    : p_impl(std::make_unique<CloudWatchImpl>()) {
    Aws::Client::ClientConfiguration aws_cfg = MakeClientConfig(cfg.aws_region);
    if (auto creds = StaticCredentials(cfg)) {
        p_impl->cloudwatch = std::make_unique<Aws::CloudWatch::CloudWatchClient>(*creds, aws_cfg);
    } else {
        p_impl->cloudwatch = std::make_unique<Aws::CloudWatch::CloudWatchClient>(aws_cfg);
    }
    p_impl->metric_namespace = cfg.service_name;
    p_impl->environment = cfg.environment;
    p_impl->region = cfg.aws_region;
}

CloudWatchMetricsRecorder::~CloudWatchMetricsRecorder() = default;

void CloudWatchMetricsRecorder::Record(const std::string& name, double value, const std::string& unit,
                                       const MetricTags& tags) noexcept {
    using namespace Aws::CloudWatch::Model;
    try {
        MetricDatum datum;
        datum.SetMetricName(name);
        datum.SetValue(value);
        datum.SetUnit(StandardUnitMapper::GetStandardUnitForName(unit));
        datum.SetTimestamp(Aws::Utils::DateTime::Now());

        auto add_dimension = [&datum](const std::string& dim_name, const std::string& dim_value) {
            Dimension dimension;
            dimension.SetName(dim_name);
            dimension.SetValue(dim_value);
            datum.AddDimensions(dimension);
        };
        add_dimension("Environment", p_impl->environment);
        add_dimension("Region", p_impl->region);
        for (const auto& [tag, tag_value] : tags) {
            add_dimension(tag, tag_value);
        }

        PutMetricDataRequest request;
        request.SetNamespace(p_impl->metric_namespace);
        request.AddMetricData(datum);

        p_impl->cloudwatch->PutMetricDataAsync(request,
            [name](const Aws::CloudWatch::CloudWatchClient*,
                   const PutMetricDataRequest&,
                   const PutMetricDataOutcome& outcome,
                   const std::shared_ptr<const Aws::Client::AsyncCallerContext>&) {
                if (!outcome.IsSuccess()) {
                    spdlog::warn("{}", DescribeError("PutMetricData " + name, outcome.GetError()));
                }
            });
    } catch (const std::exception& e) {
        spdlog::warn("Failed to record metric {}: {}", name, e.what());
    }
}

} // namespace audiocache
