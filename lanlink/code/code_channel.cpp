#include "lanlink/code/code_channel.hpp"

#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/errors.hpp"

#include <nlohmann/json.hpp>

namespace lanlink
{

using json = nlohmann::json;

Candidate CodeChannel::decode(const std::string& payload)
{
    json document;
    try
    {
        document = json::parse(payload);
    }
    catch (const json::parse_error& error)
    {
        LANLINK_LOG_DEBUG("Code payload is not JSON: " << error.what());
        throw InvalidCodeError("code is not a valid payload");
    }

    if (!document.is_object())
    {
        throw InvalidCodeError("code payload is not an object");
    }

    auto field = document.find(base_url_field);
    if (field == document.end() || !field->is_string())
    {
        throw InvalidCodeError("code payload has no baseUrl");
    }

    const auto base_url = field->get<std::string>();
    auto endpoint       = Endpoint::parse(base_url);
    if (!endpoint)
    {
        throw InvalidCodeError("code baseUrl is not a server address: " + base_url);
    }

    LANLINK_LOG_INFO("Decoded code candidate " << *endpoint);
    return Candidate::make(std::move(*endpoint), Provenance::code);
}

std::string CodeChannel::encode(const Endpoint& endpoint, const std::map<std::string, std::string>& extras)
{
    json document = json::object();
    for (const auto& [name, value] : extras)
    {
        document[name] = value;
    }
    document[base_url_field] = endpoint.to_string();
    return document.dump();
}

} // namespace lanlink
