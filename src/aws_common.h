#pragma once

#include "audiocache/errors.hpp"
#include "audiocache/types.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/ClientConfiguration.h>

#include <optional>
#include <string>

namespace audiocache {

Aws::Client::ClientConfiguration MakeClientConfig(const std::string& region,
                                                  const std::string& endpoint = "");

// Static keys from Config, or nullopt to use the SDK's default provider chain.
std::optional<Aws::Auth::AWSCredentials> StaticCredentials(const Config& cfg);

template <typename ErrorType>
std::string DescribeError(const std::string& operation, const Aws::Client::AWSError<ErrorType>& error) {
    return operation + " failed: " + std::string(error.GetExceptionName().c_str()) + " " +
           std::string(error.GetMessage().c_str());
}

// Retryable errors surface as TransientDependencyError, the rest as
// FatalDependencyError.
template <typename ErrorType>
[[noreturn]] void ThrowForError(const std::string& operation, const Aws::Client::AWSError<ErrorType>& error) {
    if (error.ShouldRetry()) {
        throw TransientDependencyError(DescribeError(operation, error));
    }
    throw FatalDependencyError(DescribeError(operation, error));
}

} // namespace audiocache
