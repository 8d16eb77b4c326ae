#pragma once

#include <stdexcept>
#include <string>

namespace lanlink
{

/// Base class of the exceptions that leave lanlink components.
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& what) : std::runtime_error(what) { }
};

/// The persisted endpoint could not be read or written.
class StorageError : public Error
{
public:
    explicit StorageError(const std::string& what) : Error(what) { }
};

/// A scanned code payload was malformed or carried no usable endpoint.
class InvalidCodeError : public Error
{
public:
    explicit InvalidCodeError(const std::string& what) : Error(what) { }
};

/**
 * Failures the reconciler recovers from locally. They never escape as exceptions;
 * they drive state transitions and the status hint.
 */
enum class FailureReason
{
    none,
    unreachable_endpoint,
    discovery_unavailable,
    storage_error
};

inline const char* to_string(FailureReason reason) noexcept
{
    switch (reason)
    {
    case FailureReason::none:
        return "none";
    case FailureReason::unreachable_endpoint:
        return "unreachable_endpoint";
    case FailureReason::discovery_unavailable:
        return "discovery_unavailable";
    case FailureReason::storage_error:
        return "storage_error";
    }
    return "unknown";
}

} // namespace lanlink
