#include "lanlink/net/network_utils.hpp"
#include "lanlink/logging/lanlink_logging.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace lanlink
{

std::optional<std::string> get_local_address_for_remote(boost::asio::io_context& io_context,
                                                        const boost::asio::ip::udp::endpoint& remote_endpoint)
{
    boost::asio::ip::udp::socket socket(io_context);
    boost::system::error_code ec;

    socket.open(remote_endpoint.protocol(), ec);
    if (ec)
    {
        LANLINK_LOG_ERROR("Failed to open socket: " << ec.message());
        return std::nullopt;
    }

    // For UDP, connect only records the peer so the OS picks the outgoing interface.
    socket.connect(remote_endpoint, ec);
    if (ec)
    {
        LANLINK_LOG_ERROR("Failed to connect socket to remote endpoint: " << ec.message());
        return std::nullopt;
    }

    auto local_endpoint = socket.local_endpoint(ec);
    if (ec)
    {
        LANLINK_LOG_ERROR("Failed to get local endpoint: " << ec.message());
        return std::nullopt;
    }

    std::string local_address = local_endpoint.address().to_string();
    LANLINK_LOG_DEBUG("Local address for remote " << remote_endpoint.address().to_string() << ": " << local_address);

    return local_address;
}

std::vector<std::string> list_lan_ipv4_addresses()
{
    std::vector<std::string> addresses;

    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0)
    {
        LANLINK_LOG_ERROR("getifaddrs failed: " << std::strerror(errno));
        return addresses;
    }

    for (ifaddrs* entry = interfaces; entry != nullptr; entry = entry->ifa_next)
    {
        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        if ((entry->ifa_flags & IFF_UP) == 0 || (entry->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }

        const auto* address_in = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
        char buffer[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &address_in->sin_addr, buffer, sizeof(buffer)) == nullptr)
        {
            continue;
        }

        std::string address(buffer);
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end())
        {
            LANLINK_LOG_TRACE("LAN address " << address << " on " << entry->ifa_name);
            addresses.push_back(std::move(address));
        }
    }

    freeifaddrs(interfaces);
    return addresses;
}

bool is_ipv4_literal(const std::string& text)
{
    if (text.empty() || text.find_first_not_of("0123456789.") != std::string::npos)
    {
        return false;
    }
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(text, ec);
    return !ec;
}

} // namespace lanlink
