#include "lanlink/net/http_exchange.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <optional>

namespace lanlink
{

namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp       = boost::asio::ip::tcp;

namespace
{

/**
 * One resolve/connect/write/read exchange. Keeps itself alive through the shared
 * pointers its completion handlers hold; a single deadline timer bounds the whole run.
 */
class HttpExchange : public std::enable_shared_from_this<HttpExchange>
{
public:
    HttpExchange(boost::asio::io_context& io_context, const Endpoint& endpoint, HttpReplyHandler on_reply)
        : _endpoint(endpoint), _resolver(io_context), _stream(io_context), _deadline(io_context), _on_reply(std::move(on_reply))
    {
    }

    void run(http::verb method, const std::string& target, std::string body, const HttpRequestOptions& options)
    {
        _request.version(11);
        _request.method(method);
        _request.target(target);
        _request.set(http::field::host, _endpoint.host() + ":" + std::to_string(_endpoint.port()));
        _request.set(http::field::user_agent, options.user_agent);
        _request.set(http::field::accept, "application/json");
        if (!body.empty())
        {
            _request.set(http::field::content_type, "application/json");
            _request.body() = std::move(body);
        }
        _request.keep_alive(false);
        _request.prepare_payload();
        _body_limit = options.body_limit;

        _deadline.expires_after(options.timeout);
        _deadline.async_wait(
            [self = shared_from_this()](const boost::system::error_code& error_code)
            {
                if (!error_code)
                {
                    self->fail(boost::asio::error::timed_out, "timed out");
                }
            });

        std::string host = _endpoint.host();
        if (!host.empty() && host.front() == '[')
        {
            host = host.substr(1, host.size() - 2);
        }

        _resolver.async_resolve(host, std::to_string(_endpoint.port()),
                                [self = shared_from_this()](const boost::system::error_code& error_code, tcp::resolver::results_type results)
                                { self->handle_resolve(error_code, std::move(results)); });
    }

private:
    void handle_resolve(const boost::system::error_code& error_code, tcp::resolver::results_type results)
    {
        if (error_code)
        {
            fail(error_code, "resolve failed");
            return;
        }

        _stream.async_connect(results,
                              [self = shared_from_this()](const boost::system::error_code& error_code, const tcp::endpoint&)
                              { self->handle_connect(error_code); });
    }

    void handle_connect(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "connect failed");
            return;
        }

        http::async_write(_stream, _request,
                          [self = shared_from_this()](const boost::system::error_code& error_code, std::size_t)
                          { self->handle_write(error_code); });
    }

    void handle_write(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "request failed");
            return;
        }

        _parser.emplace();
        _parser->body_limit(_body_limit);
        http::async_read(_stream, _buffer, *_parser,
                         [self = shared_from_this()](const boost::system::error_code& error_code, std::size_t)
                         { self->handle_read(error_code); });
    }

    void handle_read(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "response failed");
            return;
        }

        HttpReply reply;
        reply.status = _parser->get().result_int();
        reply.body   = std::move(_parser->get().body());
        finish(reply);
    }

    void fail(const boost::system::error_code& error_code, const char* stage)
    {
        if (!_finished)
        {
            LANLINK_LOG_DEBUG(_request.method_string() << " " << _endpoint.url(std::string(_request.target())) << " " << stage << " - "
                                                       << error_code.message());
        }

        HttpReply reply;
        reply.error = error_code;
        finish(reply);
    }

    void finish(const HttpReply& reply)
    {
        if (_finished)
        {
            return;
        }
        _finished = true;

        _deadline.cancel();
        _resolver.cancel();
        beast::error_code ignored;
        _stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        _stream.close();

        auto on_reply = std::move(_on_reply);
        if (on_reply)
        {
            on_reply(reply);
        }
    }

    Endpoint _endpoint;
    tcp::resolver _resolver;
    beast::tcp_stream _stream;
    boost::asio::steady_timer _deadline;
    beast::flat_buffer _buffer;
    http::request<http::string_body> _request;
    std::optional<http::response_parser<http::string_body>> _parser;
    std::size_t _body_limit = 0;
    HttpReplyHandler _on_reply;
    bool _finished = false;
};

} // namespace

void async_http_request(boost::asio::io_context& io_context, const Endpoint& endpoint, http::verb method, const std::string& target,
                        std::string body, const HttpRequestOptions& options, HttpReplyHandler on_reply)
{
    auto exchange = std::make_shared<HttpExchange>(io_context, endpoint, std::move(on_reply));
    // Start from the io_context so the handler never runs inside the caller's frame.
    boost::asio::post(io_context, [exchange, method, target, body = std::move(body), options]() mutable
                      { exchange->run(method, target, std::move(body), options); });
}

} // namespace lanlink
