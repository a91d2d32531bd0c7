#include "audiocache/s3_storage.hpp"
#include "aws_common.h"

#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace audiocache {

namespace {

bool is_not_found(const Aws::S3::S3Error& error) {
    return error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND ||
           error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
           error.GetErrorType() == Aws::S3::S3Errors::RESOURCE_NOT_FOUND;
}

} // namespace

// PIMPL for hiding AWS SDK headers
struct S3ObjectStorage::S3StorageImpl {
    std::unique_ptr<Aws::S3::S3Client> s3;
    std::string bucket;
    std::string base_url;
};

S3ObjectStorage::S3ObjectStorage(const Config& cfg) : p_impl(std::make_unique<S3StorageImpl>()) {
    if (cfg.s3_bucket.empty()) {
        throw ConfigurationError("an S3 bucket name is required");
    }
    Aws::Client::ClientConfiguration aws_cfg = MakeClientConfig(cfg.s3_region, cfg.s3_endpoint);

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    const bool useVirtualAddressing = !cfg.s3_use_path_style;

    if (auto creds = StaticCredentials(cfg)) {
        p_impl->s3 = std::make_unique<Aws::S3::S3Client>(*creds, aws_cfg,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            useVirtualAddressing);
    } else {
        p_impl->s3 = std::make_unique<Aws::S3::S3Client>(aws_cfg,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            useVirtualAddressing);
    }

    p_impl->bucket = cfg.s3_bucket;
    if (!cfg.s3_endpoint.empty()) {
        p_impl->base_url = cfg.s3_endpoint + "/" + cfg.s3_bucket;
    } else {
        p_impl->base_url = "https://" + cfg.s3_bucket + ".s3." + cfg.s3_region + ".amazonaws.com";
    }
}

S3ObjectStorage::~S3ObjectStorage() = default;

std::string S3ObjectStorage::BaseUrl() const {
    return p_impl->base_url;
}

std::optional<StoredObject> S3ObjectStorage::Get(const std::string& key) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        if (is_not_found(outcome.GetError())) {
            return std::nullopt;
        }
        throw TransientDependencyError(DescribeError("GetObject " + key, outcome.GetError()));
    }

    StoredObject object;
    auto& body = outcome.GetResult().GetBody();
    std::stringstream ss;
    ss << body.rdbuf();
    std::string s = ss.str();
    object.data.assign(s.begin(), s.end());
    object.last_modified_ms = outcome.GetResult().GetLastModified().Millis();
    return object;
}

bool S3ObjectStorage::Put(const std::string& key, bytes_view data, const ObjectMetadata& meta) {
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);
    request.SetContentType(meta.content_type);
    request.SetCacheControl(meta.cache_control);
    for (const auto& [name, value] : meta.user_metadata) {
        request.AddMetadata(name, value);
    }

    auto stream = std::make_shared<Aws::StringStream>();
    stream->write(reinterpret_cast<const char*>(data.data()), data.size());
    request.SetBody(stream);

    auto outcome = p_impl->s3->PutObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        if (error.ShouldRetry()) {
            throw TransientDependencyError(DescribeError("PutObject " + key, error));
        }
        spdlog::warn("{}", DescribeError("PutObject " + key, error));
        return false;
    }
    return true;
}

std::optional<std::int64_t> S3ObjectStorage::HeadMetadata(const std::string& key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->HeadObject(request);
    if (!outcome.IsSuccess()) {
        if (is_not_found(outcome.GetError())) {
            return std::nullopt;
        }
        throw TransientDependencyError(DescribeError("HeadObject " + key, outcome.GetError()));
    }
    return outcome.GetResult().GetLastModified().Millis();
}

bool S3ObjectStorage::Delete(const std::string& key) {
    Aws::S3::Model::DeleteObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->DeleteObject(request);
    if (!outcome.IsSuccess()) {
        if (is_not_found(outcome.GetError())) {
            return false;
        }
        throw TransientDependencyError(DescribeError("DeleteObject " + key, outcome.GetError()));
    }
    return true;
}

} // namespace audiocache
