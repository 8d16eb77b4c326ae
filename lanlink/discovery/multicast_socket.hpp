#pragma once

#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <string>

namespace lanlink
{

/**
 * Opens socket on the multicast port with address reuse, joins the group and keeps
 * datagrams on the local segment (hops = 1, loopback on so a server on the same host is seen).
 * On failure the socket is closed and the error returned.
 */
boost::system::error_code open_multicast_socket(boost::asio::ip::udp::socket& socket, const std::string& group, unsigned short port);

/// The group endpoint datagrams are sent to.
boost::asio::ip::udp::endpoint multicast_destination(const std::string& group, unsigned short port);

} // namespace lanlink
