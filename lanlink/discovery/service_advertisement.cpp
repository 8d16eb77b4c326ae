#include "lanlink/discovery/service_advertisement.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

#include <nlohmann/json.hpp>

namespace lanlink
{

using json = nlohmann::json;

namespace
{

std::optional<AdvertisementKind> kind_from_string(const std::string& text)
{
    if (text == "query")
    {
        return AdvertisementKind::query;
    }
    if (text == "announce")
    {
        return AdvertisementKind::announce;
    }
    if (text == "goodbye")
    {
        return AdvertisementKind::goodbye;
    }
    return std::nullopt;
}

} // namespace

const char* to_string(AdvertisementKind kind) noexcept
{
    switch (kind)
    {
    case AdvertisementKind::query:
        return "query";
    case AdvertisementKind::announce:
        return "announce";
    case AdvertisementKind::goodbye:
        return "goodbye";
    }
    return "unknown";
}

std::string AdvertisementMessage::construct(const ServiceAdvertisement& advertisement)
{
    json message = {
        {"proto", discovery_protocol},
        {"kind", to_string(advertisement.kind)},
        {"type", advertisement.service_type},
    };

    if (advertisement.kind != AdvertisementKind::query)
    {
        message["name"]      = advertisement.name;
        message["port"]      = advertisement.port;
        message["addresses"] = advertisement.addresses;
        message["txt"]       = advertisement.metadata;
        message["ttl"]       = advertisement.ttl.count();
    }
    return message.dump();
}

std::optional<ServiceAdvertisement> AdvertisementMessage::parse(const std::string& datagram)
{
    const auto message = json::parse(datagram, nullptr, false);
    if (message.is_discarded() || !message.is_object())
    {
        LANLINK_LOG_DEBUG("Ignoring datagram that is not a JSON object");
        return std::nullopt;
    }

    if (message.value("proto", std::string()) != discovery_protocol)
    {
        LANLINK_LOG_DEBUG("Ignoring datagram with foreign protocol tag");
        return std::nullopt;
    }

    ServiceAdvertisement advertisement;

    auto kind = kind_from_string(message.value("kind", std::string()));
    if (!kind)
    {
        LANLINK_LOG_DEBUG("Ignoring datagram with unknown kind");
        return std::nullopt;
    }
    advertisement.kind = *kind;

    auto type = message.find("type");
    if (type == message.end() || !type->is_string() || type->get<std::string>().empty())
    {
        LANLINK_LOG_DEBUG("Ignoring datagram without service type");
        return std::nullopt;
    }
    advertisement.service_type = type->get<std::string>();

    if (advertisement.kind == AdvertisementKind::query)
    {
        return advertisement;
    }

    auto port = message.find("port");
    if (port == message.end() || !port->is_number_unsigned() || port->get<unsigned int>() == 0 || port->get<unsigned int>() > 65535)
    {
        LANLINK_LOG_DEBUG("Ignoring " << to_string(advertisement.kind) << " without a valid port");
        return std::nullopt;
    }
    advertisement.port = static_cast<unsigned short>(port->get<unsigned int>());

    auto name = message.find("name");
    if (name != message.end() && name->is_string())
    {
        advertisement.name = name->get<std::string>();
    }

    auto addresses = message.find("addresses");
    if (addresses != message.end() && addresses->is_array())
    {
        for (const auto& address : *addresses)
        {
            if (address.is_string())
            {
                advertisement.addresses.push_back(address.get<std::string>());
            }
        }
    }

    auto metadata = message.find("txt");
    if (metadata != message.end() && metadata->is_object())
    {
        for (const auto& item : metadata->items())
        {
            const auto& value                   = item.value();
            advertisement.metadata[item.key()] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    auto ttl = message.find("ttl");
    if (ttl != message.end() && ttl->is_number_unsigned())
    {
        advertisement.ttl = std::chrono::seconds(ttl->get<unsigned int>());
    }

    return advertisement;
}

ServiceAdvertisement AdvertisementMessage::make_query(const std::string& service_type)
{
    ServiceAdvertisement query;
    query.kind         = AdvertisementKind::query;
    query.service_type = service_type;
    return query;
}

} // namespace lanlink
