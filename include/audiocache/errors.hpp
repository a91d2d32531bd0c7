#pragma once

#include <stdexcept>
#include <string>

namespace audiocache {

// Root of every error this library throws.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A remote dependency (object store, synthesis provider, edge) could not be
// reached. Retrying later may succeed.
class TransientDependencyError : public Error {
public:
    using Error::Error;
};

// The dependency answered but rejected the request; retrying will not help.
class FatalDependencyError : public Error {
public:
    using Error::Error;
};

// Persisted metadata or payload could not be read back.
class CorruptionError : public Error {
public:
    using Error::Error;
};

// Invalid TTL, capacity or interval at startup.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Synthesis is switched off (cache-only mode) and the key is not cached.
class GenerationDisabledError : public Error {
public:
    using Error::Error;
};

class GenerationTimeoutError : public Error {
public:
    using Error::Error;
};

class GenerationCancelledError : public Error {
public:
    using Error::Error;
};

} // namespace audiocache
