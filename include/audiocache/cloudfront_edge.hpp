#pragma once

#include "providers.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace audiocache {

// EdgeDeliveryProvider over a CloudFront distribution. With no domain
// configured the edge is treated as reachable and has nothing to invalidate.
class CloudFrontEdgeDelivery : public EdgeDeliveryProvider {
public:
    explicit CloudFrontEdgeDelivery(const Config& cfg);
    ~CloudFrontEdgeDelivery() override;

    bool Invalidate(const std::string& path) override;
    bool IsReachable() override;
    std::string UrlFor(const std::string& path) const override;

private:
    struct CloudFrontImpl;
    std::unique_ptr<CloudFrontImpl> p_impl;
};

} // namespace audiocache
