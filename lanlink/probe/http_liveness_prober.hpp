#pragma once

#include "lanlink/probe/liveness_prober.hpp"

#include <boost/asio/io_context.hpp>

namespace lanlink
{

/// LivenessProber issuing "GET /health" over HTTP/1.1 with Boost.Beast.
class HttpLivenessProber : public LivenessProber
{
public:
    /// Upper bound on the /health body; anything larger is treated as a dead server.
    static constexpr std::size_t max_body_size = 64 * 1024;

    explicit HttpLivenessProber(boost::asio::io_context& io_context);

    HttpLivenessProber(const HttpLivenessProber&)            = delete;
    HttpLivenessProber& operator=(const HttpLivenessProber&) = delete;

    void async_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout, ProbeHandler on_result) override;

    /**
     * @brief Decide liveness from a /health response.
     * @return alive only for status 200 with a JSON object body whose "ok" is boolean true
     */
    static HealthResult interpret_response(unsigned int status, const std::string& body);

private:
    boost::asio::io_context& _io_context;
};

} // namespace lanlink
