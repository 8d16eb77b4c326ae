#pragma once

#include "lanlink/flags/flags.hpp"
#include "lanlink/items/item_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace lanlink
{

enum class HealthServerState : std::uint8_t
{
    start_signaled,
    accepting,
    accept_backoff,
    stop_signaled,
    stopping
};

/// What /server-info reports about this server.
struct ServerIdentity
{
    std::string name;
    std::string service_type;
};

/**
 * @brief Minimal HTTP/1.1 server answering the discovery probes and the item CRUD.
 *
 * GET /health          -> {"ok":true,"time":"..."}
 * GET /server-info     -> {"ok":true,"name","type","port","urls":[...],"time"}
 * GET /items           -> [{"id","title","updated_at"}, ...], newest first
 * POST /items          -> 201 with the new item; body {"title":"..."}
 * PUT /items/<id>      -> the renamed item; body {"title":"..."}
 * DELETE /items/<id>   -> {"ok":true}
 *
 * Unknown paths are 404, known paths with another method 405. Bad ids and empty titles
 * are 400, ids with no item 404. One request per connection.
 */
class HealthServer
{
public:
    using Request         = boost::beast::http::request<boost::beast::http::string_body>;
    using Response        = boost::beast::http::response<boost::beast::http::string_body>;
    using AddressProvider = std::function<std::vector<std::string>()>;

    static constexpr unsigned short default_port = 4310;

    /// Pause before accepting again after an accept error, e.g. when out of descriptors.
    static constexpr std::chrono::milliseconds accept_retry_delay {250};

    /**
     * @param io_context The Boost.Asio io_context to use
     * @param identity Name and service type reported by /server-info
     * @param endpoint Address and port to listen on; port 0 picks a free port
     */
    HealthServer(boost::asio::io_context& io_context, ServerIdentity identity, const boost::asio::ip::tcp::endpoint& endpoint);
    ~HealthServer();

    HealthServer(const HealthServer&)            = delete;
    HealthServer& operator=(const HealthServer&) = delete;
    HealthServer(HealthServer&&)                 = delete;
    HealthServer& operator=(HealthServer&&)      = delete;

    bool async_start();

    bool async_stop(std::function<void()> on_stopped);

    unsigned short port() const { return _local_endpoint.port(); }

    /// Replace the LAN address lookup used for the urls list (list_lan_ipv4_addresses by default).
    void set_address_provider(AddressProvider provider);

    /// Build the response for one request. Called from the io_context thread by every session.
    Response respond(const Request& request);

    ItemStore& items() { return _items; }

    /// Accept errors seen so far, aborted accepts not counted.
    std::size_t failed_accepts() const;

    /// Every LAN URL the server can be reached at, e.g. "http://192.168.1.20:4310".
    std::vector<std::string> lan_urls() const;

    static std::string now_iso8601();

private:
    void async_accept();
    void handle_accept(const boost::system::error_code& error_code, boost::asio::ip::tcp::socket socket);
    void handle_accept_retry(const boost::system::error_code& error_code);
    Response respond_items(const Request& request, const std::string& path);
    void resolve_on_stopped();

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    ServerIdentity _identity;
    boost::asio::ip::tcp::acceptor _acceptor;
    boost::asio::ip::tcp::endpoint _local_endpoint;
    boost::asio::steady_timer _accept_retry_timer;
    ItemStore _items;
    std::size_t _failed_accepts = 0;
    AddressProvider _address_provider;
    std::function<void()> _on_stopped;
    Flags<HealthServerState> _flags;
};

} // namespace lanlink
