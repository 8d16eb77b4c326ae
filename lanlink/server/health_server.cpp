#include "lanlink/server/health_server.hpp"

#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/network_utils.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>

namespace lanlink
{

namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp       = boost::asio::ip::tcp;
using json      = nlohmann::json;

namespace
{

constexpr std::chrono::seconds request_timeout(10);

// Reads one request, writes one response, closes. The server must outlive its sessions.
class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket&& socket, HealthServer& server) : _stream(std::move(socket)), _server(server) { }

    void run()
    {
        _stream.expires_after(request_timeout);
        http::async_read(_stream, _buffer, _request,
                         [self = shared_from_this()](const beast::error_code& error_code, std::size_t)
                         { self->handle_read(error_code); });
    }

private:
    void handle_read(const beast::error_code& error_code)
    {
        if (error_code)
        {
            if (error_code != http::error::end_of_stream)
            {
                LANLINK_LOG_DEBUG("HTTP read failed: " << error_code.message());
            }
            close();
            return;
        }

        _response = _server.respond(_request);
        LANLINK_LOG_DEBUG(_request.method_string() << " " << _request.target() << " -> " << _response.result_int());

        _stream.expires_after(request_timeout);
        http::async_write(_stream, _response,
                          [self = shared_from_this()](const beast::error_code& error_code, std::size_t)
                          {
                              if (error_code)
                              {
                                  LANLINK_LOG_DEBUG("HTTP write failed: " << error_code.message());
                              }
                              self->close();
                          });
    }

    void close()
    {
        beast::error_code ignored;
        _stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        _stream.close();
    }

    beast::tcp_stream _stream;
    beast::flat_buffer _buffer;
    HealthServer::Request _request;
    HealthServer::Response _response;
    HealthServer& _server;
};

HealthServer::Response make_json_response(const HealthServer::Request& request, http::status status, const json& body)
{
    HealthServer::Response response {status, request.version()};
    response.set(http::field::server, "lanlink");
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(false);
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

// Answer to a CORS preflight, so browser pages on other origins may write items.
HealthServer::Response make_preflight_response(const HealthServer::Request& request)
{
    HealthServer::Response response {http::status::no_content, request.version()};
    response.set(http::field::server, "lanlink");
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET,HEAD,PUT,PATCH,POST,DELETE");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    response.keep_alive(false);
    response.prepare_payload();
    return response;
}

/// Positive decimal id from a path segment, std::nullopt for anything else.
std::optional<std::int64_t> parse_item_id(const std::string& segment)
{
    if (segment.empty() || segment.size() > 18)
    {
        return std::nullopt;
    }

    std::int64_t id = 0;
    for (const char digit : segment)
    {
        if (!std::isdigit(static_cast<unsigned char>(digit)))
        {
            return std::nullopt;
        }
        id = id * 10 + (digit - '0');
    }
    if (id <= 0)
    {
        return std::nullopt;
    }
    return id;
}

/**
 * Trimmed "title" of a JSON request body. A missing body or title reads as empty; numbers
 * and booleans are taken in their JSON spelling.
 * @return std::nullopt when the body is not a JSON object
 */
std::optional<std::string> read_title(const HealthServer::Request& request)
{
    if (request.body().empty())
    {
        return std::string();
    }

    const auto document = json::parse(request.body(), nullptr, false);
    if (document.is_discarded() || !document.is_object())
    {
        return std::nullopt;
    }

    auto title = document.find("title");
    if (title == document.end() || title->is_null())
    {
        return std::string();
    }
    if (title->is_string())
    {
        return ItemStore::trim_title(title->get<std::string>());
    }
    return ItemStore::trim_title(title->dump());
}

} // namespace

HealthServer::HealthServer(boost::asio::io_context& io_context, ServerIdentity identity, const tcp::endpoint& endpoint)
    : _io_context(io_context)
    , _identity(std::move(identity))
    , _acceptor(io_context, endpoint)
    , _local_endpoint(_acceptor.local_endpoint())
    , _accept_retry_timer(io_context)
    , _address_provider(&list_lan_ipv4_addresses)
{
}

HealthServer::~HealthServer()
{
    boost::system::error_code ignored;
    _acceptor.close(ignored);
}

bool HealthServer::async_start()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(HealthServerState::start_signaled) || _flags.get_flag(HealthServerState::stopping))
    {
        return false;
    }
    _flags.set_flag(HealthServerState::start_signaled);
    LANLINK_LOG_INFO("HTTP server listening on " << _local_endpoint);

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          async_accept();
                      });
    return true;
}

bool HealthServer::async_stop(std::function<void()> on_stopped)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(HealthServerState::stop_signaled) || !_flags.get_flag(HealthServerState::start_signaled))
    {
        return false;
    }
    _flags.set_flag(HealthServerState::stop_signaled);
    _flags.set_flag(HealthServerState::stopping);
    _on_stopped = std::move(on_stopped);

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> lock(_mutex);
                          boost::system::error_code ignored;
                          _acceptor.close(ignored);
                          _accept_retry_timer.cancel();
                          resolve_on_stopped();
                      });
    return true;
}

void HealthServer::set_address_provider(AddressProvider provider)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _address_provider = std::move(provider);
}

void HealthServer::async_accept()
{
    if (_flags.get_flag(HealthServerState::stopping))
    {
        resolve_on_stopped();
        return;
    }

    _flags.set_flag(HealthServerState::accepting);
    _acceptor.async_accept([this](const boost::system::error_code& error_code, tcp::socket socket)
                           { handle_accept(error_code, std::move(socket)); });
}

void HealthServer::handle_accept(const boost::system::error_code& error_code, tcp::socket socket)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(HealthServerState::accepting);

    if (!error_code)
    {
        std::make_shared<HttpSession>(std::move(socket), *this)->run();
        async_accept();
        return;
    }

    if (error_code == boost::asio::error::operation_aborted || _flags.get_flag(HealthServerState::stopping))
    {
        LANLINK_LOG_TRACE("Accept operation aborted.");
        async_accept();
        return;
    }

    // EMFILE and similar errors persist until a descriptor is released.
    ++_failed_accepts;
    LANLINK_LOG_ERROR("Accept failed: " << error_code.message() << ", retrying in " << accept_retry_delay.count() << " ms");
    _flags.set_flag(HealthServerState::accept_backoff);
    _accept_retry_timer.expires_after(accept_retry_delay);
    _accept_retry_timer.async_wait([this](const boost::system::error_code& timer_error) { handle_accept_retry(timer_error); });
}

void HealthServer::handle_accept_retry(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(HealthServerState::accept_backoff);
    if (error_code && error_code != boost::asio::error::operation_aborted)
    {
        LANLINK_LOG_ERROR("Accept retry timer failed: " << error_code.message());
    }
    async_accept();
}

std::size_t HealthServer::failed_accepts() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _failed_accepts;
}

void HealthServer::resolve_on_stopped()
{
    if (!_flags.get_flag(HealthServerState::accepting) && !_flags.get_flag(HealthServerState::accept_backoff) && _on_stopped)
    {
        auto stopped_callback = std::move(_on_stopped);
        _on_stopped           = nullptr;
        boost::asio::post(_io_context, std::move(stopped_callback));
    }
}

HealthServer::Response HealthServer::respond(const Request& request)
{
    if (request.method() == http::verb::options)
    {
        return make_preflight_response(request);
    }

    const std::string target(request.target());
    const std::string path = target.substr(0, target.find('?'));

    if (path == "/items" || path.compare(0, 7, "/items/") == 0)
    {
        return respond_items(request, path);
    }

    if (path != "/health" && path != "/server-info")
    {
        return make_json_response(request, http::status::not_found, {{"error", "not found"}});
    }

    if (request.method() != http::verb::get)
    {
        return make_json_response(request, http::status::method_not_allowed, {{"error", "method not allowed"}});
    }

    if (path == "/health")
    {
        return make_json_response(request, http::status::ok, {{"ok", true}, {"time", now_iso8601()}});
    }

    json body = {
        {"ok", true},
        {"name", _identity.name},
        {"type", _identity.service_type},
        {"port", port()},
        {"urls", lan_urls()},
        {"time", now_iso8601()},
    };
    return make_json_response(request, http::status::ok, body);
}

HealthServer::Response HealthServer::respond_items(const Request& request, const std::string& path)
{
    if (path == "/items")
    {
        if (request.method() == http::verb::get)
        {
            return make_json_response(request, http::status::ok, _items.list());
        }
        if (request.method() != http::verb::post)
        {
            return make_json_response(request, http::status::method_not_allowed, {{"error", "method not allowed"}});
        }

        const auto title = read_title(request);
        if (!title)
        {
            return make_json_response(request, http::status::bad_request, {{"error", "invalid json"}});
        }
        if (title->empty())
        {
            return make_json_response(request, http::status::bad_request, {{"error", "title required"}});
        }
        return make_json_response(request, http::status::created, _items.create(*title, now_iso8601()));
    }

    if (request.method() != http::verb::put && request.method() != http::verb::delete_)
    {
        return make_json_response(request, http::status::method_not_allowed, {{"error", "method not allowed"}});
    }

    const auto id = parse_item_id(path.substr(7));
    if (!id)
    {
        return make_json_response(request, http::status::bad_request, {{"error", "invalid id"}});
    }

    if (request.method() == http::verb::delete_)
    {
        if (!_items.remove(*id))
        {
            return make_json_response(request, http::status::not_found, {{"error", "not found"}});
        }
        return make_json_response(request, http::status::ok, {{"ok", true}});
    }

    const auto title = read_title(request);
    if (!title)
    {
        return make_json_response(request, http::status::bad_request, {{"error", "invalid json"}});
    }
    if (title->empty())
    {
        return make_json_response(request, http::status::bad_request, {{"error", "title required"}});
    }

    auto item = _items.update(*id, *title, now_iso8601());
    if (!item)
    {
        return make_json_response(request, http::status::not_found, {{"error", "not found"}});
    }
    return make_json_response(request, http::status::ok, *item);
}

std::vector<std::string> HealthServer::lan_urls() const
{
    AddressProvider provider;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        provider = _address_provider;
    }

    std::vector<std::string> urls;
    for (const auto& address : provider())
    {
        urls.push_back("http://" + address + ":" + std::to_string(port()));
    }
    return urls;
}

std::string HealthServer::now_iso8601()
{
    const auto now          = std::chrono::system_clock::now();
    const auto seconds      = std::chrono::system_clock::to_time_t(now);
    const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc {};
    gmtime_r(&seconds, &utc);

    std::ostringstream stream;
    stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds << 'Z';
    return stream.str();
}

} // namespace lanlink
