#pragma once

#include <memory>

namespace audiocache {

// Owns the process-wide Aws::InitAPI / Aws::ShutdownAPI pair. Create one
// before any AWS adapter and destroy it after the last one.
class AwsSession {
public:
    AwsSession();
    ~AwsSession();

private:
    struct Impl;
    std::unique_ptr<Impl> p_impl;

    AwsSession(const AwsSession&) = delete;
    AwsSession& operator=(const AwsSession&) = delete;
};

} // namespace audiocache
