#pragma once

#include "lanlink/items/item.hpp"
#include "lanlink/net/http_exchange.hpp"
#include "lanlink/reconcile/connection_reconciler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lanlink
{

/**
 * @brief CRUD calls against /items on the server the reconciler is connected to.
 *
 * Every call reads ConnectionReconciler::current_endpoint() when it is made. Without a
 * connection the handler gets boost::asio::error::not_connected and no request is sent.
 * Server answers map to error codes: 400 is errc::invalid_argument, 404 is
 * errc::no_such_file_or_directory, other failures errc::protocol_error, and a body that is
 * not the expected JSON errc::bad_message. Handlers run on the io_context.
 */
class ItemsClient
{
public:
    using ListHandler = std::function<void(const boost::system::error_code& error_code, const std::vector<Item>& items)>;
    using ItemHandler = std::function<void(const boost::system::error_code& error_code, const Item& item)>;
    using DoneHandler = std::function<void(const boost::system::error_code& error_code)>;

    ItemsClient(boost::asio::io_context& io_context, const ConnectionReconciler& reconciler,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(4000));

    ItemsClient(const ItemsClient&)            = delete;
    ItemsClient& operator=(const ItemsClient&) = delete;

    void async_list(ListHandler on_items);

    void async_create(const std::string& title, ItemHandler on_item);

    void async_rename(std::int64_t id, const std::string& title, ItemHandler on_item);

    void async_remove(std::int64_t id, DoneHandler on_done);

    /// Error for a response status, clear for 2xx.
    static boost::system::error_code error_from_status(unsigned int status);

private:
    void send(boost::beast::http::verb method, const std::string& target, std::string body, HttpReplyHandler on_reply);

    boost::asio::io_context& _io_context;
    const ConnectionReconciler& _reconciler;
    HttpRequestOptions _options;
};

} // namespace lanlink
