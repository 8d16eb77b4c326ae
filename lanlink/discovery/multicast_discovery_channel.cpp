#include "lanlink/discovery/multicast_discovery_channel.hpp"

#include "lanlink/discovery/discovery_states.hpp"
#include "lanlink/discovery/multicast_socket.hpp"
#include "lanlink/flags/flags.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/network_utils.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <memory>
#include <set>

namespace lanlink
{

using boost::asio::ip::udp;

namespace
{

class MulticastListener : public std::enable_shared_from_this<MulticastListener>
{
public:
    MulticastListener(boost::asio::io_context& io_context, const MulticastDiscoveryConfig& config, std::string service_type,
                      DiscoveryChannel::CandidateHandler on_candidate, DiscoveryChannel::ErrorHandler on_error)
        : _io_context(io_context)
        , _config(config)
        , _service_type(std::move(service_type))
        , _query(AdvertisementMessage::construct(AdvertisementMessage::make_query(_service_type)))
        , _socket(io_context)
        , _timer(io_context)
        , _recv_buffer()
        , _on_candidate(std::move(on_candidate))
        , _on_error(std::move(on_error))
    {
    }

    void start()
    {
        auto ec = open_multicast_socket(_socket, _config.group, _config.port);
        if (ec)
        {
            report_failure(ec);
            return;
        }

        _flags.set_flag(MulticastSocketState::running);
        LANLINK_LOG_INFO("Listening for '" << _service_type << "' on " << _config.group << ":" << _config.port);
        start_receive();
        send_query();
    }

    void stop()
    {
        if (_flags.get_flag(MulticastSocketState::stopping))
        {
            return;
        }
        _flags.set_flag(MulticastSocketState::stopping);

        boost::system::error_code ignored;
        _timer.cancel();
        _socket.close(ignored);
        LANLINK_LOG_DEBUG("Discovery listener for '" << _service_type << "' stopped");
    }

private:
    bool is_active() const
    {
        return !_flags.get_flag(MulticastSocketState::stopping) && !_flags.get_flag(MulticastSocketState::failed);
    }

    void start_receive()
    {
        _flags.set_flag(MulticastSocketState::receiving_async);
        _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _sender_endpoint,
                                   [self = shared_from_this()](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                                   { self->handle_receive(error_code, bytes_transferred); });
    }

    void handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred)
    {
        _flags.clear_flag(MulticastSocketState::receiving_async);

        if (error_code)
        {
            if (error_code == boost::asio::error::operation_aborted || !is_active())
            {
                LANLINK_LOG_TRACE("Discovery receive aborted.");
            }
            else
            {
                report_failure(error_code);
            }
            return;
        }

        if (bytes_transferred > 0)
        {
            handle_datagram(std::string(_recv_buffer.data(), bytes_transferred));
        }

        if (is_active())
        {
            start_receive();
        }
    }

    void handle_datagram(const std::string& datagram)
    {
        auto advertisement = AdvertisementMessage::parse(datagram);
        if (!advertisement || advertisement->kind == AdvertisementKind::query)
        {
            return;
        }

        if (advertisement->service_type != _service_type)
        {
            LANLINK_LOG_TRACE("Ignoring " << to_string(advertisement->kind) << " for '" << advertisement->service_type << "' from "
                                          << _sender_endpoint);
            return;
        }

        auto endpoint = MulticastDiscoveryChannel::resolve_endpoint(*advertisement);
        if (!endpoint)
        {
            LANLINK_LOG_DEBUG("Dropping " << to_string(advertisement->kind) << " of '" << advertisement->name
                                          << "' without a usable IPv4 address");
            return;
        }

        if (advertisement->kind == AdvertisementKind::goodbye)
        {
            LANLINK_LOG_INFO("Service '" << advertisement->name << "' at " << *endpoint << " retracted");
            _emitted.erase(endpoint->to_string());
            return;
        }

        if (!_emitted.insert(endpoint->to_string()).second)
        {
            LANLINK_LOG_TRACE("Duplicate announcement for " << *endpoint);
            return;
        }

        LANLINK_LOG_INFO("Discovered '" << advertisement->name << "' at " << *endpoint);
        deliver(Candidate::make(std::move(*endpoint), Provenance::discovered));
    }

    void deliver(Candidate candidate)
    {
        boost::asio::post(_io_context,
                          [self = shared_from_this(), candidate = std::move(candidate)]()
                          {
                              if (!self->_flags.get_flag(MulticastSocketState::stopping) && self->_on_candidate)
                              {
                                  self->_on_candidate(candidate);
                              }
                          });
    }

    void send_query()
    {
        LANLINK_LOG_TRACE("Sending discovery query: " << _query);
        _flags.set_flag(MulticastSocketState::sending_async);
        _socket.async_send_to(boost::asio::buffer(_query), multicast_destination(_config.group, _config.port),
                              [self = shared_from_this()](const boost::system::error_code& error_code, std::size_t)
                              { self->handle_send_complete(error_code); });
    }

    void handle_send_complete(const boost::system::error_code& error_code)
    {
        _flags.clear_flag(MulticastSocketState::sending_async);

        if (error_code)
        {
            if (error_code == boost::asio::error::operation_aborted || !is_active())
            {
                LANLINK_LOG_TRACE("Discovery query sending aborted.");
            }
            else
            {
                report_failure(error_code);
            }
            return;
        }

        if (is_active())
        {
            _flags.set_flag(MulticastSocketState::timer_running);
            _timer.expires_after(_config.query_interval);
            _timer.async_wait([self = shared_from_this()](const boost::system::error_code& error_code) { self->handle_timeout(error_code); });
        }
    }

    void handle_timeout(const boost::system::error_code& error_code)
    {
        _flags.clear_flag(MulticastSocketState::timer_running);
        if (!error_code && is_active())
        {
            send_query();
        }
    }

    // The listener is exhausted after the first failure.
    void report_failure(const boost::system::error_code& error_code)
    {
        if (!is_active())
        {
            return;
        }
        _flags.set_flag(MulticastSocketState::failed);
        LANLINK_LOG_ERROR("Multicast discovery unavailable: " << error_code.message());

        boost::system::error_code ignored;
        _timer.cancel();
        _socket.close(ignored);

        boost::asio::post(_io_context,
                          [self = shared_from_this(), error_code]()
                          {
                              if (!self->_flags.get_flag(MulticastSocketState::stopping) && self->_on_error)
                              {
                                  self->_on_error(error_code);
                              }
                          });
    }

    boost::asio::io_context& _io_context;
    MulticastDiscoveryConfig _config;
    std::string _service_type;
    std::string _query;
    udp::socket _socket;
    udp::endpoint _sender_endpoint;
    boost::asio::steady_timer _timer;
    static constexpr std::size_t recv_buffer_size = 2048;
    std::array<char, recv_buffer_size> _recv_buffer;
    std::set<std::string> _emitted;
    DiscoveryChannel::CandidateHandler _on_candidate;
    DiscoveryChannel::ErrorHandler _on_error;
    Flags<MulticastSocketState> _flags;
};

class ListenerHandle : public DiscoveryHandle
{
public:
    explicit ListenerHandle(std::shared_ptr<MulticastListener> listener) : _listener(std::move(listener)) { }

    ~ListenerHandle() override { stop(); }

    void stop() override
    {
        if (_listener)
        {
            _listener->stop();
            _listener.reset();
        }
    }

private:
    std::shared_ptr<MulticastListener> _listener;
};

} // namespace

MulticastDiscoveryChannel::MulticastDiscoveryChannel(boost::asio::io_context& io_context, MulticastDiscoveryConfig config)
    : _io_context(io_context), _config(std::move(config))
{
}

std::unique_ptr<DiscoveryHandle> MulticastDiscoveryChannel::start(const std::string& service_type, CandidateHandler on_candidate,
                                                                  ErrorHandler on_error)
{
    auto listener = std::make_shared<MulticastListener>(_io_context, _config, service_type, std::move(on_candidate), std::move(on_error));
    listener->start();
    return std::make_unique<ListenerHandle>(std::move(listener));
}

std::optional<Endpoint> MulticastDiscoveryChannel::resolve_endpoint(const ServiceAdvertisement& advertisement)
{
    for (const auto& address : advertisement.addresses)
    {
        if (is_ipv4_literal(address))
        {
            return Endpoint::from_host_port(address, advertisement.port);
        }
    }
    return std::nullopt;
}

} // namespace lanlink
