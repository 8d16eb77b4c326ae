#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanlink
{

/// Wire protocol identifier carried in every discovery datagram.
inline constexpr const char* discovery_protocol = "lanlink/1";

/// Service type tag shared by publisher and discovery channel.
inline constexpr const char* default_service_type = "_lanlink._tcp";

/// Administratively scoped group; never routed off the local network.
inline constexpr const char* default_multicast_group = "239.255.43.10";
inline constexpr unsigned short default_multicast_port = 43100;

enum class AdvertisementKind
{
    query,
    announce,
    goodbye
};

const char* to_string(AdvertisementKind kind) noexcept;

/**
 * @brief A server announcing (or retracting) its presence, or a client asking for one.
 *
 * Queries carry only the kind and the service type.
 */
struct ServiceAdvertisement
{
    AdvertisementKind kind = AdvertisementKind::announce;
    std::string service_type;
    std::string name;
    unsigned short port = 0;
    std::vector<std::string> addresses;
    std::map<std::string, std::string> metadata;
    std::chrono::seconds ttl {0};
};

/**
 * @brief Creates and parses discovery datagrams.
 *
 * Datagrams are UTF-8 JSON objects, e.g.
 * {"proto":"lanlink/1","kind":"announce","type":"_lanlink._tcp","name":"Office","port":4310,
 *  "addresses":["192.168.1.20"],"txt":{"v":"1"},"ttl":120}
 */
class AdvertisementMessage
{
public:
    static std::string construct(const ServiceAdvertisement& advertisement);

    /// @return The advertisement, or std::nullopt when the datagram is not a lanlink message
    static std::optional<ServiceAdvertisement> parse(const std::string& datagram);

    static ServiceAdvertisement make_query(const std::string& service_type);
};

} // namespace lanlink
