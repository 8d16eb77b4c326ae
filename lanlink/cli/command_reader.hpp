#pragma once

#include "lanlink/items/items_client.hpp"
#include "lanlink/reconcile/connection_reconciler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>

#include <ostream>
#include <string>

namespace lanlink
{

/**
 * Line commands for the client:
 *   code <payload>        submit a scanned code
 *   retry                 restart discovery
 *   forget                forget the saved server
 *   status                print the status line
 *   items                 list the items on the server
 *   add <title>           create an item
 *   rename <id> <title>   change the title of an item
 *   delete <id>           delete an item
 *   quit                  stop the io_context
 */
class CommandReader
{
public:
    CommandReader(boost::asio::io_context& io_context, ConnectionReconciler& reconciler, ItemsClient& items, std::ostream& out);

    CommandReader(const CommandReader&)            = delete;
    CommandReader& operator=(const CommandReader&) = delete;

    /**
     * @brief Read commands from a duplicate of descriptor, leaving the original open.
     * @return false, after logging why, when the descriptor cannot be duplicated or watched
     */
    bool attach(int descriptor);

    /// Wait for the next line. Does nothing until a descriptor is attached.
    void start();

    /// Run one command line. @return false for quit
    bool execute(const std::string& line);

private:
    void handle_line(const boost::system::error_code& error_code);
    void print_error(const std::string& action, const boost::system::error_code& error_code);

    boost::asio::io_context& _io_context;
    boost::asio::posix::stream_descriptor _input;
    boost::asio::streambuf _buffer;
    ConnectionReconciler& _reconciler;
    ItemsClient& _items;
    std::ostream& _out;
};

} // namespace lanlink
