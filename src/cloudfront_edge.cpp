#include "audiocache/cloudfront_edge.hpp"
#include "aws_common.h"

#include <aws/cloudfront/CloudFrontClient.h>
#include <aws/cloudfront/model/CreateInvalidation2020_05_31Request.h>
#include <aws/cloudfront/model/InvalidationBatch.h>
#include <aws/cloudfront/model/Paths.h>
#include <aws/core/http/HttpClient.h>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/stream/ResponseStream.h>
#include <spdlog/spdlog.h>

namespace audiocache {

namespace {
// CloudFront is a global service homed in us-east-1.
constexpr char kCloudFrontRegion[] = "us-east-1";
constexpr char kHealthPath[] = "/health-check";
} // namespace

struct CloudFrontEdgeDelivery::CloudFrontImpl {
    std::unique_ptr<Aws::CloudFront::CloudFrontClient> cloudfront;
    std::shared_ptr<Aws::Http::HttpClient> http;
    std::string domain;
    std::string distribution_id;
};

CloudFrontEdgeDelivery::CloudFrontEdgeDelivery(const Config& cfg) : p_impl(std::make_unique<CloudFrontImpl>()) {
    Aws::Client::ClientConfiguration aws_cfg = MakeClientConfig(kCloudFrontRegion);
    if (auto creds = StaticCredentials(cfg)) {
        p_impl->cloudfront = std::make_unique<Aws::CloudFront::CloudFrontClient>(*creds, aws_cfg);
    } else {
        p_impl->cloudfront = std::make_unique<Aws::CloudFront::CloudFrontClient>(aws_cfg);
    }

    Aws::Client::ClientConfiguration http_cfg = MakeClientConfig(kCloudFrontRegion);
    http_cfg.requestTimeoutMs = 5000;
    p_impl->http = Aws::Http::CreateHttpClient(http_cfg);

    p_impl->domain = cfg.edge_domain;
    p_impl->distribution_id = cfg.edge_distribution_id;
}

CloudFrontEdgeDelivery::~CloudFrontEdgeDelivery() = default;

std::string CloudFrontEdgeDelivery::UrlFor(const std::string& path) const {
    if (p_impl->domain.empty()) {
        return {};
    }
    return "https://" + p_impl->domain + path;
}

bool CloudFrontEdgeDelivery::Invalidate(const std::string& path) {
    if (p_impl->distribution_id.empty()) {
        return true;
    }
    using namespace Aws::CloudFront::Model;

    Paths paths;
    paths.SetQuantity(1);
    paths.AddItems(path);

    InvalidationBatch batch;
    batch.SetPaths(paths);
    batch.SetCallerReference("invalidation-" + std::to_string(Aws::Utils::DateTime::CurrentTimeMillis()));

    CreateInvalidation2020_05_31Request request;
    request.SetDistributionId(p_impl->distribution_id);
    request.SetInvalidationBatch(batch);

    auto outcome = p_impl->cloudfront->CreateInvalidation2020_05_31(request);
    if (!outcome.IsSuccess()) {
        spdlog::warn("{}", DescribeError("CreateInvalidation " + path, outcome.GetError()));
        return false;
    }
    spdlog::info("CloudFront invalidation created for {}", path);
    return true;
}

bool CloudFrontEdgeDelivery::IsReachable() {
    if (p_impl->domain.empty()) {
        return true;
    }
    auto request = Aws::Http::CreateHttpRequest(Aws::String("https://" + p_impl->domain + kHealthPath),
                                                Aws::Http::HttpMethod::HTTP_HEAD,
                                                Aws::Utils::Stream::DefaultResponseStreamFactoryMethod);
    auto response = p_impl->http->MakeRequest(request);
    if (!response || response->GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
        return false;
    }
    return static_cast<int>(response->GetResponseCode()) < 500;
}

} // namespace audiocache
