#pragma once

#include "lanlink/net/endpoint.hpp"

#include <map>
#include <string>

namespace lanlink
{

/**
 * @brief Converts between endpoints and the JSON payload carried by a scannable code.
 *
 * Payload shape: {"baseUrl":"http://192.168.1.50:4310", ...}. Fields other than
 * baseUrl are informational and ignored when decoding.
 */
class CodeChannel
{
public:
    static constexpr const char* base_url_field = "baseUrl";

    /**
     * @brief Decode a scanned payload into a code candidate.
     * @throws InvalidCodeError if the payload is not a JSON object with a valid baseUrl
     */
    static Candidate decode(const std::string& payload);

    /**
     * @brief Build the payload a code generator renders for an endpoint.
     * @param extras Additional string fields, e.g. the server name
     */
    static std::string encode(const Endpoint& endpoint, const std::map<std::string, std::string>& extras = {});
};

} // namespace lanlink
