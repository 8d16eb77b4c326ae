#pragma once

#include "lanlink/discovery/discovery_states.hpp"
#include "lanlink/discovery/service_advertisement.hpp"
#include "lanlink/flags/flags.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace lanlink
{

struct PublisherConfig
{
    std::string group                           = default_multicast_group;
    unsigned short port                         = default_multicast_port;
    std::chrono::milliseconds announce_interval = std::chrono::milliseconds(5000);
    std::chrono::seconds ttl                    = std::chrono::seconds(120);
};

/**
 * @brief Server side of multicast discovery.
 *
 * Announces the service when started, every announce_interval, and whenever a query for its
 * service type arrives. Stopping (or destroying) the publisher multicasts a goodbye before the
 * socket closes, so clients never keep a stale advertisement.
 */
class AdvertisementPublisher
{
public:
    /**
     * @param io_context The Boost.Asio io_context to run on
     * @param service Name, type, port and metadata to advertise. Addresses are filled in per announcement.
     * @param config Multicast group and timing
     */
    AdvertisementPublisher(boost::asio::io_context& io_context, ServiceAdvertisement service, PublisherConfig config = {});
    ~AdvertisementPublisher();

    AdvertisementPublisher(const AdvertisementPublisher&)            = delete;
    AdvertisementPublisher& operator=(const AdvertisementPublisher&) = delete;
    AdvertisementPublisher(AdvertisementPublisher&&)                 = delete;
    AdvertisementPublisher& operator=(AdvertisementPublisher&&)      = delete;

    /// @return false if already started or the multicast socket could not be opened
    bool async_start();

    /**
     * Retract the advertisement and stop.
     * @param on_stopped Invoked on the io_context once no operation is outstanding
     * @return false if a stop is already in progress
     */
    bool async_stop(std::function<void()> on_stopped);

    /**
     * @brief The announcement sent to a requester.
     * @param preferred_address Address to list first, typically the one the requester can reach
     */
    ServiceAdvertisement make_announcement(const std::optional<std::string>& preferred_address = std::nullopt) const;

    std::size_t announcement_count() const;

private:
    void start_receive();
    void handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void announce(const std::optional<std::string>& preferred_address);
    void handle_send(const boost::system::error_code& error_code);
    void schedule_announce();
    void handle_timer(const boost::system::error_code& error_code);
    void send_goodbye();
    void resolve_on_stopped();

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    ServiceAdvertisement _service;
    PublisherConfig _config;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    boost::asio::steady_timer _timer;
    static constexpr std::size_t recv_buffer_size = 2048;
    std::array<char, recv_buffer_size> _recv_buffer;

    std::size_t _sends_in_flight    = 0;
    std::size_t _announcement_count = 0;
    bool _retracted                 = false;

    std::function<void()> _on_stopped;
    Flags<MulticastSocketState> _flags;
};

} // namespace lanlink
