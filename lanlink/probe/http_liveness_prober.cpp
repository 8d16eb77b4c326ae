#include "lanlink/probe/http_liveness_prober.hpp"

#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/http_exchange.hpp"

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

namespace lanlink
{

namespace http = boost::beast::http;

HttpLivenessProber::HttpLivenessProber(boost::asio::io_context& io_context) : _io_context(io_context)
{
}

void HttpLivenessProber::async_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout, ProbeHandler on_result)
{
    LANLINK_LOG_DEBUG("Probing " << endpoint.url(health_path) << " (timeout " << timeout.count() << " ms)");

    HttpRequestOptions options;
    options.timeout    = timeout;
    options.body_limit = max_body_size;
    options.user_agent = "lanlink-prober";

    async_http_request(_io_context, endpoint, http::verb::get, health_path, {}, options,
                       [endpoint, on_result = std::move(on_result)](const HttpReply& reply)
                       {
                           HealthResult result;
                           if (!reply.error)
                           {
                               result = interpret_response(reply.status, reply.body);
                           }
                           LANLINK_LOG_DEBUG("Probe of " << endpoint << (result.alive ? " accepted" : " rejected"));
                           on_result(result);
                       });
}

HealthResult HttpLivenessProber::interpret_response(unsigned int status, const std::string& body)
{
    HealthResult result;
    if (status != static_cast<unsigned int>(http::status::ok))
    {
        LANLINK_LOG_DEBUG("Health status " << status << " is not a success");
        return result;
    }

    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object())
    {
        LANLINK_LOG_DEBUG("Health body is not a JSON object");
        return result;
    }

    auto ok = document.find("ok");
    if (ok == document.end() || !ok->is_boolean() || !ok->get<bool>())
    {
        LANLINK_LOG_DEBUG("Health body has no true \"ok\" marker");
        return result;
    }

    result.alive = true;
    auto time    = document.find("time");
    if (time != document.end() && time->is_string())
    {
        result.server_time = time->get<std::string>();
    }
    return result;
}

} // namespace lanlink
