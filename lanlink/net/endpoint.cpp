#include "lanlink/net/endpoint.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cctype>

namespace lanlink
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool is_dotted_numeric(const std::string& host)
{
    return std::all_of(host.begin(), host.end(), [](unsigned char character) { return std::isdigit(character) || character == '.'; });
}

// RFC 1123 host name: dot separated labels of letters, digits and inner hyphens.
bool is_host_name(const std::string& host)
{
    if (host.empty() || host.size() > 253)
    {
        return false;
    }

    std::size_t label_start = 0;
    while (label_start <= host.size())
    {
        std::size_t label_end = host.find('.', label_start);
        if (label_end == std::string::npos)
        {
            label_end = host.size();
        }

        const std::size_t label_length = label_end - label_start;
        if (label_length == 0 || label_length > 63)
        {
            return false;
        }
        if (host[label_start] == '-' || host[label_end - 1] == '-')
        {
            return false;
        }
        for (std::size_t i = label_start; i < label_end; ++i)
        {
            const auto character = static_cast<unsigned char>(host[i]);
            if (!std::isalnum(character) && character != '-')
            {
                return false;
            }
        }
        label_start = label_end + 1;
    }
    return true;
}

std::optional<unsigned short> parse_port(const std::string& text)
{
    if (text.empty() || text.size() > 5 || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        return std::nullopt;
    }
    const unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535)
    {
        return std::nullopt;
    }
    return static_cast<unsigned short>(value);
}

// Returns the normalized host, or an empty string when the host is not acceptable.
std::string normalize_host(const std::string& host)
{
    boost::system::error_code ec;
    if (!host.empty() && host.front() == '[')
    {
        if (host.size() < 3 || host.back() != ']')
        {
            return {};
        }
        auto address = boost::asio::ip::make_address_v6(host.substr(1, host.size() - 2), ec);
        return ec ? std::string() : "[" + address.to_string() + "]";
    }

    if (is_dotted_numeric(host))
    {
        auto address = boost::asio::ip::make_address_v4(host, ec);
        return ec ? std::string() : address.to_string();
    }

    auto lowered = to_lower(host);
    return is_host_name(lowered) ? lowered : std::string();
}

} // namespace

Endpoint::Endpoint(std::string scheme, std::string host, unsigned short port)
    : _scheme(std::move(scheme))
    , _host(std::move(host))
    , _port(port)
    , _normalized(_scheme + "://" + _host + ":" + std::to_string(_port))
{
}

std::optional<Endpoint> Endpoint::parse(const std::string& text)
{
    const std::string input = trim(text);

    const auto scheme_end = input.find("://");
    if (scheme_end == std::string::npos)
    {
        LANLINK_LOG_DEBUG("Rejected endpoint (missing scheme): " << input);
        return std::nullopt;
    }

    std::string scheme = to_lower(input.substr(0, scheme_end));
    if (scheme != "http")
    {
        LANLINK_LOG_DEBUG("Rejected endpoint (unsupported scheme '" << scheme << "'): " << input);
        return std::nullopt;
    }

    std::string rest          = input.substr(scheme_end + 3);
    const auto authority_end  = rest.find_first_of("/?#");
    std::string authority     = rest.substr(0, authority_end);
    const std::string trailer = authority_end == std::string::npos ? std::string() : rest.substr(authority_end);
    if (!trailer.empty() && trailer != "/")
    {
        LANLINK_LOG_DEBUG("Rejected endpoint (path, query or fragment present): " << input);
        return std::nullopt;
    }

    if (authority.find('@') != std::string::npos)
    {
        LANLINK_LOG_DEBUG("Rejected endpoint (user info present): " << input);
        return std::nullopt;
    }

    std::string host;
    std::string port_text;
    if (!authority.empty() && authority.front() == '[')
    {
        const auto bracket_end = authority.find(']');
        if (bracket_end == std::string::npos)
        {
            LANLINK_LOG_DEBUG("Rejected endpoint (unterminated IPv6 literal): " << input);
            return std::nullopt;
        }
        host                  = authority.substr(0, bracket_end + 1);
        const auto after_host = authority.substr(bracket_end + 1);
        if (!after_host.empty())
        {
            if (after_host.front() != ':')
            {
                LANLINK_LOG_DEBUG("Rejected endpoint (garbage after IPv6 literal): " << input);
                return std::nullopt;
            }
            port_text = after_host.substr(1);
            if (port_text.empty())
            {
                return std::nullopt;
            }
        }
    }
    else
    {
        const auto colon = authority.find(':');
        host             = authority.substr(0, colon);
        if (colon != std::string::npos)
        {
            port_text = authority.substr(colon + 1);
            if (port_text.empty())
            {
                LANLINK_LOG_DEBUG("Rejected endpoint (empty port): " << input);
                return std::nullopt;
            }
        }
    }

    unsigned short port = default_http_port;
    if (!port_text.empty())
    {
        auto parsed_port = parse_port(port_text);
        if (!parsed_port)
        {
            LANLINK_LOG_DEBUG("Rejected endpoint (invalid port '" << port_text << "'): " << input);
            return std::nullopt;
        }
        port = *parsed_port;
    }

    std::string normalized_host = normalize_host(host);
    if (normalized_host.empty())
    {
        LANLINK_LOG_DEBUG("Rejected endpoint (invalid host '" << host << "'): " << input);
        return std::nullopt;
    }

    return Endpoint(std::move(scheme), std::move(normalized_host), port);
}

std::optional<Endpoint> Endpoint::from_host_port(const std::string& host, unsigned short port)
{
    if (port == 0)
    {
        return std::nullopt;
    }

    // Bare IPv6 literals need brackets inside a URL.
    const bool bare_ipv6 = host.find(':') != std::string::npos && (host.empty() || host.front() != '[');
    std::string normalized_host = normalize_host(bare_ipv6 ? "[" + host + "]" : host);
    if (normalized_host.empty())
    {
        return std::nullopt;
    }
    return Endpoint("http", std::move(normalized_host), port);
}

std::ostream& operator<<(std::ostream& stream, const Endpoint& endpoint)
{
    return stream << endpoint.to_string();
}

} // namespace lanlink
