#pragma once

#include "lanlink/net/endpoint.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace lanlink
{

/// Outcome of one liveness probe. Only used to accept or reject a candidate.
struct HealthResult
{
    bool alive = false;
    std::string server_time; ///< Server wall clock as reported by /health, empty when unknown
};

/**
 * @brief Confirms that an endpoint is serving before the client commits to it.
 *
 * Implementations must call on_result exactly once, on the io_context the prober was
 * built with, within the given timeout. Unreachable hosts, bad statuses, malformed
 * bodies and timeouts are all reported as alive == false, never thrown.
 */
class LivenessProber
{
public:
    using ProbeHandler = std::function<void(const HealthResult& result)>;

    static constexpr const char* health_path = "/health";
    static constexpr std::chrono::milliseconds default_timeout {4000};

    virtual ~LivenessProber() = default;

    virtual void async_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout, ProbeHandler on_result) = 0;
};

} // namespace lanlink
