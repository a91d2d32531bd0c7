#pragma once

#include "providers.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace audiocache {

// ObjectStorageProvider over an S3 bucket (or any S3-compatible endpoint).
// Requires a live AwsSession.
class S3ObjectStorage : public ObjectStorageProvider {
public:
    explicit S3ObjectStorage(const Config& cfg);
    ~S3ObjectStorage() override;

    std::optional<StoredObject> Get(const std::string& key) override;
    bool Put(const std::string& key, bytes_view data, const ObjectMetadata& meta) override;
    std::optional<std::int64_t> HeadMetadata(const std::string& key) override;
    bool Delete(const std::string& key) override;

    // Public base URL of the bucket, used for direct delivery.
    std::string BaseUrl() const;

private:
    struct S3StorageImpl;
    std::unique_ptr<S3StorageImpl> p_impl;
};

} // namespace audiocache
