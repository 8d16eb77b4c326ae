#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lanlink
{

/**
 * Determines the local IP address that would be used to reach a remote endpoint.
 *
 * Connects a UDP socket to the remote endpoint and reads back the local endpoint the
 * OS selected. No datagram is sent.
 *
 * @param io_context The Boost.Asio io_context to use for socket operations
 * @param remote_endpoint The remote endpoint to check reachability for
 * @return The local IP address as a string, or std::nullopt if determination failed
 */
std::optional<std::string> get_local_address_for_remote(boost::asio::io_context& io_context,
                                                        const boost::asio::ip::udp::endpoint& remote_endpoint);

/**
 * Lists every IPv4 address bound to an interface that is up and not a loopback interface,
 * in interface order and without duplicates.
 */
std::vector<std::string> list_lan_ipv4_addresses();

/// True when text is a dotted-quad IPv4 address.
bool is_ipv4_literal(const std::string& text);

} // namespace lanlink
