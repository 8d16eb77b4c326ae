#pragma once

#include "lanlink/net/endpoint.hpp"

#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lanlink
{

/**
 * @brief Cancellation handle for one running discovery listener.
 *
 * stop() releases the listener and is idempotent; destroying the handle stops it too.
 * After stop() returns no further candidate or error is delivered.
 */
class DiscoveryHandle
{
public:
    virtual ~DiscoveryHandle() = default;

    virtual void stop() = 0;
};

/**
 * @brief A restartable source of discovered candidates.
 *
 * Candidates are delivered one at a time, in arrival order, on the channel's io_context.
 * on_error is called at most once per start, when the underlying mechanism cannot be used;
 * the listener is exhausted afterwards.
 */
class DiscoveryChannel
{
public:
    using CandidateHandler = std::function<void(const Candidate& candidate)>;
    using ErrorHandler     = std::function<void(const boost::system::error_code& error_code)>;

    virtual ~DiscoveryChannel() = default;

    virtual std::unique_ptr<DiscoveryHandle> start(const std::string& service_type, CandidateHandler on_candidate,
                                                   ErrorHandler on_error) = 0;
};

} // namespace lanlink
