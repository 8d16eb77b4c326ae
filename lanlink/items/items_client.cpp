#include "lanlink/items/items_client.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

namespace lanlink
{

namespace http = boost::beast::http;
namespace errc = boost::system::errc;
using json     = nlohmann::json;

namespace
{

/// Reply error, else status error, else clear.
boost::system::error_code reply_error(const HttpReply& reply)
{
    if (reply.error)
    {
        return reply.error;
    }
    return ItemsClient::error_from_status(reply.status);
}

void deliver_item(const HttpReply& reply, const ItemsClient::ItemHandler& on_item)
{
    auto error_code = reply_error(reply);
    Item item;
    if (!error_code)
    {
        const auto document = json::parse(reply.body, nullptr, false);
        try
        {
            item = document.get<Item>();
        }
        catch (const json::exception& error)
        {
            LANLINK_LOG_DEBUG("Unexpected item: " << error.what());
            error_code = errc::make_error_code(errc::bad_message);
        }
    }
    on_item(error_code, item);
}

} // namespace

ItemsClient::ItemsClient(boost::asio::io_context& io_context, const ConnectionReconciler& reconciler, std::chrono::milliseconds timeout)
    : _io_context(io_context), _reconciler(reconciler)
{
    _options.timeout    = timeout;
    _options.user_agent = "lanlink-client";
}

void ItemsClient::async_list(ListHandler on_items)
{
    send(http::verb::get, "/items", {},
         [on_items = std::move(on_items)](const HttpReply& reply)
         {
             auto error_code = reply_error(reply);
             std::vector<Item> items;
             if (!error_code)
             {
                 const auto document = json::parse(reply.body, nullptr, false);
                 if (document.is_discarded() || !document.is_array())
                 {
                     error_code = errc::make_error_code(errc::bad_message);
                 }
                 else
                 {
                     try
                     {
                         items = document.get<std::vector<Item>>();
                     }
                     catch (const json::exception& error)
                     {
                         LANLINK_LOG_DEBUG("Unexpected item list: " << error.what());
                         error_code = errc::make_error_code(errc::bad_message);
                     }
                 }
             }
             on_items(error_code, items);
         });
}

void ItemsClient::async_create(const std::string& title, ItemHandler on_item)
{
    send(http::verb::post, "/items", json {{"title", title}}.dump(),
         [on_item = std::move(on_item)](const HttpReply& reply) { deliver_item(reply, on_item); });
}

void ItemsClient::async_rename(std::int64_t id, const std::string& title, ItemHandler on_item)
{
    send(http::verb::put, "/items/" + std::to_string(id), json {{"title", title}}.dump(),
         [on_item = std::move(on_item)](const HttpReply& reply) { deliver_item(reply, on_item); });
}

void ItemsClient::async_remove(std::int64_t id, DoneHandler on_done)
{
    send(http::verb::delete_, "/items/" + std::to_string(id), {},
         [on_done = std::move(on_done)](const HttpReply& reply) { on_done(reply_error(reply)); });
}

boost::system::error_code ItemsClient::error_from_status(unsigned int status)
{
    if (status >= 200 && status < 300)
    {
        return {};
    }
    if (status == 400)
    {
        return errc::make_error_code(errc::invalid_argument);
    }
    if (status == 404)
    {
        return errc::make_error_code(errc::no_such_file_or_directory);
    }
    return errc::make_error_code(errc::protocol_error);
}

void ItemsClient::send(http::verb method, const std::string& target, std::string body, HttpReplyHandler on_reply)
{
    const auto endpoint = _reconciler.current_endpoint();
    if (!endpoint)
    {
        LANLINK_LOG_DEBUG("Not connected, " << http::to_string(method) << " " << target << " not sent");
        HttpReply reply;
        reply.error = boost::asio::error::not_connected;
        boost::asio::post(_io_context, [reply, on_reply = std::move(on_reply)]() { on_reply(reply); });
        return;
    }

    async_http_request(_io_context, *endpoint, method, target, std::move(body), _options, std::move(on_reply));
}

} // namespace lanlink
