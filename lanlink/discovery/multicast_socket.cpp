#include "lanlink/discovery/multicast_socket.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

#include <boost/asio/ip/multicast.hpp>

namespace lanlink
{

using boost::asio::ip::udp;

boost::system::error_code open_multicast_socket(udp::socket& socket, const std::string& group, unsigned short port)
{
    boost::system::error_code ec;
    auto group_address = boost::asio::ip::make_address_v4(group, ec);
    if (ec)
    {
        LANLINK_LOG_ERROR("Invalid multicast group '" << group << "': " << ec.message());
        return ec;
    }

    auto fail = [&socket](const char* step, const boost::system::error_code& error_code)
    {
        LANLINK_LOG_ERROR("Multicast socket " << step << " failed: " << error_code.message());
        boost::system::error_code ignored;
        socket.close(ignored);
        return error_code;
    };

    socket.open(udp::v4(), ec);
    if (ec)
    {
        return fail("open", ec);
    }
    socket.set_option(udp::socket::reuse_address(true), ec);
    if (ec)
    {
        return fail("reuse_address", ec);
    }
    socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), port), ec);
    if (ec)
    {
        return fail("bind", ec);
    }
    socket.set_option(boost::asio::ip::multicast::join_group(group_address), ec);
    if (ec)
    {
        return fail("join_group", ec);
    }
    socket.set_option(boost::asio::ip::multicast::enable_loopback(true), ec);
    if (ec)
    {
        return fail("enable_loopback", ec);
    }
    socket.set_option(boost::asio::ip::multicast::hops(1), ec);
    if (ec)
    {
        return fail("hops", ec);
    }

    LANLINK_LOG_DEBUG("Joined multicast group " << group << ":" << port);
    return ec;
}

udp::endpoint multicast_destination(const std::string& group, unsigned short port)
{
    return udp::endpoint(boost::asio::ip::make_address_v4(group), port);
}

} // namespace lanlink
