#pragma once

#include "lanlink/discovery/discovery_channel.hpp"
#include "lanlink/discovery/service_advertisement.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace lanlink
{

struct MulticastDiscoveryConfig
{
    std::string group                        = default_multicast_group;
    unsigned short port                      = default_multicast_port;
    std::chrono::milliseconds query_interval = std::chrono::milliseconds(1000);
};

/**
 * @brief DiscoveryChannel listening for lanlink advertisements on a multicast group.
 *
 * Every start() opens its own socket, sends a query for the service type right away and
 * repeats it every query_interval until stopped. Announcements for other service types
 * are ignored. Each resolved endpoint is emitted once per listener; a goodbye for it
 * allows it to be emitted again. start() and the handle must be used from the io_context
 * thread.
 */
class MulticastDiscoveryChannel : public DiscoveryChannel
{
public:
    explicit MulticastDiscoveryChannel(boost::asio::io_context& io_context, MulticastDiscoveryConfig config = {});

    MulticastDiscoveryChannel(const MulticastDiscoveryChannel&)            = delete;
    MulticastDiscoveryChannel& operator=(const MulticastDiscoveryChannel&) = delete;

    std::unique_ptr<DiscoveryHandle> start(const std::string& service_type, CandidateHandler on_candidate,
                                           ErrorHandler on_error) override;

    /**
     * @brief Endpoint of an announcement: the first syntactically valid IPv4 address with the
     * advertised port. std::nullopt when no address qualifies.
     */
    static std::optional<Endpoint> resolve_endpoint(const ServiceAdvertisement& advertisement);

private:
    boost::asio::io_context& _io_context;
    MulticastDiscoveryConfig _config;
};

} // namespace lanlink
