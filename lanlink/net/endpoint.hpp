#pragma once

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace lanlink
{

/**
 * @brief A server address on the local network in normalized "scheme://host:port" form.
 *
 * Only Endpoint::parse and Endpoint::from_host_port create instances, so every Endpoint
 * that exists is well formed. Two endpoints are equal when their normalized strings are.
 */
class Endpoint
{
public:
    static constexpr unsigned short default_http_port = 80;

    /**
     * @brief Parse a base URL such as "http://192.168.1.50:4310".
     *
     * Accepts an optional trailing slash and an omitted port (the scheme's default).
     * Rejects unknown schemes, user info, paths, queries, fragments and bad ports.
     * @return The endpoint, or std::nullopt when the text is not a valid base URL
     */
    static std::optional<Endpoint> parse(const std::string& text);

    /// Build an http endpoint from an address literal or host name and a port.
    static std::optional<Endpoint> from_host_port(const std::string& host, unsigned short port);

    const std::string& scheme() const noexcept { return _scheme; }
    const std::string& host() const noexcept { return _host; }
    unsigned short port() const noexcept { return _port; }

    const std::string& to_string() const noexcept { return _normalized; }

    /// The URL of a path on this endpoint, e.g. url("/health").
    std::string url(const std::string& path) const { return _normalized + path; }

    bool operator==(const Endpoint& other) const noexcept { return _normalized == other._normalized; }
    bool operator!=(const Endpoint& other) const noexcept { return _normalized != other._normalized; }
    bool operator<(const Endpoint& other) const noexcept { return _normalized < other._normalized; }

private:
    Endpoint(std::string scheme, std::string host, unsigned short port);

    std::string _scheme;
    std::string _host;
    unsigned short _port;
    std::string _normalized;
};

std::ostream& operator<<(std::ostream& stream, const Endpoint& endpoint);

/// Where a candidate endpoint came from.
enum class Provenance
{
    persisted,
    discovered,
    code
};

inline const char* to_string(Provenance provenance) noexcept
{
    switch (provenance)
    {
    case Provenance::persisted:
        return "persisted";
    case Provenance::discovered:
        return "discovered";
    case Provenance::code:
        return "code";
    }
    return "unknown";
}

/// An endpoint that has not been validated yet, tagged with its source.
struct Candidate
{
    Endpoint endpoint;
    Provenance provenance;
    std::chrono::steady_clock::time_point discovered_at;

    static Candidate make(Endpoint endpoint, Provenance provenance)
    {
        return Candidate {std::move(endpoint), provenance, std::chrono::steady_clock::now()};
    }
};

} // namespace lanlink
