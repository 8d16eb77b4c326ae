#pragma once

#include "lanlink/net/endpoint.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace lanlink
{

/// Result of one HTTP exchange. status and body are only meaningful when error is clear.
struct HttpReply
{
    boost::system::error_code error;
    unsigned int status = 0;
    std::string body;
};

using HttpReplyHandler = std::function<void(const HttpReply& reply)>;

struct HttpRequestOptions
{
    std::chrono::milliseconds timeout = std::chrono::milliseconds(4000);
    std::size_t body_limit            = 1024 * 1024; ///< Larger responses fail with http::error::body_limit
    std::string user_agent            = "lanlink";
};

/**
 * @brief Send one HTTP/1.1 request to endpoint and read the response.
 *
 * The connection is closed afterwards. One deadline covers resolve, connect, write and read;
 * when it passes the reply carries boost::asio::error::timed_out. A non-empty body is sent as
 * application/json. on_reply runs exactly once, on the io_context, never inside this call.
 */
void async_http_request(boost::asio::io_context& io_context, const Endpoint& endpoint, boost::beast::http::verb method,
                        const std::string& target, std::string body, const HttpRequestOptions& options, HttpReplyHandler on_reply);

} // namespace lanlink
