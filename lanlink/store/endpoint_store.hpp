#pragma once

#include "lanlink/net/endpoint.hpp"

#include <optional>

namespace lanlink
{

/**
 * @brief Durable home of the last endpoint the client connected to.
 *
 * Every call is a real round trip to storage. Implementations throw StorageError only
 * when the underlying storage fails.
 */
class EndpointStore
{
public:
    virtual ~EndpointStore() = default;

    /// Overwrite the stored endpoint.
    virtual void save(const Endpoint& endpoint) = 0;

    /// The stored endpoint, or std::nullopt when nothing is stored.
    virtual std::optional<Endpoint> load() = 0;

    /// Remove the stored endpoint. Clearing an empty store is not an error.
    virtual void clear() = 0;
};

} // namespace lanlink
