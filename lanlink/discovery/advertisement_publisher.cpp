#include "lanlink/discovery/advertisement_publisher.hpp"

#include "lanlink/discovery/multicast_socket.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/network_utils.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <memory>

namespace lanlink
{

using boost::asio::ip::udp;

AdvertisementPublisher::AdvertisementPublisher(boost::asio::io_context& io_context, ServiceAdvertisement service, PublisherConfig config)
    : _io_context(io_context), _service(std::move(service)), _config(std::move(config)), _socket(io_context), _timer(io_context), _recv_buffer()
{
    _service.kind = AdvertisementKind::announce;
}

AdvertisementPublisher::~AdvertisementPublisher()
{
    std::unique_lock<std::mutex> lock(_mutex);
    send_goodbye();
    boost::system::error_code ignored;
    _timer.cancel();
    _socket.close(ignored);
}

bool AdvertisementPublisher::async_start()
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(MulticastSocketState::running) || _flags.get_flag(MulticastSocketState::stopping))
        {
            return false;
        }

        auto ec = open_multicast_socket(_socket, _config.group, _config.port);
        if (ec)
        {
            LANLINK_LOG_ERROR("Cannot publish '" << _service.name << "': " << ec.message());
            return false;
        }
        _flags.set_flag(MulticastSocketState::running);
        _retracted = false;
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          if (!_flags.get_flag(MulticastSocketState::stopping))
                          {
                              LANLINK_LOG_INFO("Publishing '" << _service.name << "' as " << _service.service_type << " on port "
                                                              << _service.port);
                              start_receive();
                              announce(std::nullopt);
                              schedule_announce();
                          }
                          else
                          {
                              resolve_on_stopped();
                          }
                      });

    return true;
}

bool AdvertisementPublisher::async_stop(std::function<void()> on_stopped)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(MulticastSocketState::stopping))
        {
            return false;
        }

        _flags.set_flag(MulticastSocketState::stopping);
        _on_stopped = std::move(on_stopped);
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          send_goodbye();

                          boost::system::error_code ignored;
                          _timer.cancel();
                          _socket.close(ignored);
                          resolve_on_stopped();
                      });

    return true;
}

ServiceAdvertisement AdvertisementPublisher::make_announcement(const std::optional<std::string>& preferred_address) const
{
    ServiceAdvertisement announcement = _service;
    announcement.kind                 = AdvertisementKind::announce;
    announcement.ttl                  = _config.ttl;
    announcement.addresses.clear();

    if (preferred_address)
    {
        announcement.addresses.push_back(*preferred_address);
    }
    for (auto& address : list_lan_ipv4_addresses())
    {
        if (std::find(announcement.addresses.begin(), announcement.addresses.end(), address) == announcement.addresses.end())
        {
            announcement.addresses.push_back(std::move(address));
        }
    }
    return announcement;
}

std::size_t AdvertisementPublisher::announcement_count() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _announcement_count;
}

void AdvertisementPublisher::start_receive()
{
    _flags.set_flag(MulticastSocketState::receiving_async);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { handle_receive(error_code, bytes_transferred); });
}

void AdvertisementPublisher::handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(MulticastSocketState::receiving_async);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            LANLINK_LOG_TRACE("Publisher receive operation aborted.");
        }
        else
        {
            LANLINK_LOG_ERROR("Publisher receive error: " << error_code.message());
        }
    }
    else if (bytes_transferred > 0)
    {
        auto message = AdvertisementMessage::parse(std::string(_recv_buffer.data(), bytes_transferred));
        if (message && message->kind == AdvertisementKind::query && message->service_type == _service.service_type)
        {
            LANLINK_LOG_DEBUG("Query for " << message->service_type << " from " << _remote_endpoint);
            announce(get_local_address_for_remote(_io_context, _remote_endpoint));
        }
    }

    if (!_flags.get_flag(MulticastSocketState::stopping) && _socket.is_open())
    {
        start_receive();
        return;
    }
    resolve_on_stopped();
}

void AdvertisementPublisher::announce(const std::optional<std::string>& preferred_address)
{
    // Requesters on the same segment all listen on the group, so replies are multicast too.
    auto datagram = std::make_shared<std::string>(AdvertisementMessage::construct(make_announcement(preferred_address)));
    LANLINK_LOG_TRACE("Announcing: " << *datagram);

    ++_sends_in_flight;
    _flags.set_flag(MulticastSocketState::sending_async);
    _socket.async_send_to(boost::asio::buffer(*datagram), multicast_destination(_config.group, _config.port),
                          [this, datagram](const boost::system::error_code& error_code, std::size_t) { handle_send(error_code); });
}

void AdvertisementPublisher::handle_send(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            LANLINK_LOG_TRACE("Announcement sending aborted.");
        }
        else
        {
            LANLINK_LOG_ERROR("Announcement send error: " << error_code.message());
        }
    }
    else
    {
        ++_announcement_count;
    }

    if (--_sends_in_flight == 0)
    {
        _flags.clear_flag(MulticastSocketState::sending_async);
    }
    resolve_on_stopped();
}

void AdvertisementPublisher::schedule_announce()
{
    _flags.set_flag(MulticastSocketState::timer_running);
    _timer.expires_after(_config.announce_interval);
    _timer.async_wait([this](const boost::system::error_code& error_code) { handle_timer(error_code); });
}

void AdvertisementPublisher::handle_timer(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(MulticastSocketState::timer_running);

    if (!error_code && !_flags.get_flag(MulticastSocketState::stopping))
    {
        announce(std::nullopt);
        schedule_announce();
        return;
    }
    resolve_on_stopped();
}

void AdvertisementPublisher::send_goodbye()
{
    if (_retracted || !_socket.is_open())
    {
        return;
    }
    _retracted = true;

    ServiceAdvertisement goodbye = make_announcement();
    goodbye.kind                 = AdvertisementKind::goodbye;
    goodbye.ttl                  = std::chrono::seconds(0);

    // Blocking send: the goodbye must leave before the socket closes.
    boost::system::error_code ec;
    _socket.send_to(boost::asio::buffer(AdvertisementMessage::construct(goodbye)), multicast_destination(_config.group, _config.port), 0, ec);
    if (ec)
    {
        LANLINK_LOG_ERROR("Failed to retract '" << _service.name << "': " << ec.message());
    }
    else
    {
        LANLINK_LOG_INFO("Retracted '" << _service.name << "'");
    }
}

void AdvertisementPublisher::resolve_on_stopped()
{
    if (_flags.get_flag(MulticastSocketState::stopping))
    {
        if (!_flags.get_flag(MulticastSocketState::receiving_async) && !_flags.get_flag(MulticastSocketState::sending_async) &&
            !_flags.get_flag(MulticastSocketState::timer_running))
        {
            _flags.clear_flag(MulticastSocketState::running);
            if (_on_stopped)
            {
                boost::asio::post(_io_context, std::move(_on_stopped));
                _on_stopped = nullptr;
            }
        }
    }
}

} // namespace lanlink
