#include "lanlink/discovery/service_advertisement.hpp"
#include "lanlink/probe/http_liveness_prober.hpp"
#include "lanlink/server/health_server.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <optional>

using namespace lanlink;
using namespace lanlink::test;
using namespace std::chrono_literals;
using boost::asio::ip::tcp;

namespace
{

tcp::endpoint loopback_any_port()
{
    return tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0);
}

class HttpLivenessProberTest : public ::testing::Test
{
protected:
    HttpLivenessProberTest() : prober(io_context) { }

    std::optional<HealthResult> probe(unsigned short port, std::chrono::milliseconds timeout = 1000ms)
    {
        std::optional<HealthResult> result;
        prober.async_probe(*Endpoint::from_host_port("127.0.0.1", port), timeout,
                           [&result](const HealthResult& outcome) { result = outcome; });
        run_until(io_context, [&result]() { return result.has_value(); }, timeout + 2000ms);
        return result;
    }

    boost::asio::io_context io_context;
    HttpLivenessProber prober;
};

} // namespace

TEST_F(HttpLivenessProberTest, AcceptsHealthServer)
{
    HealthServer server(io_context, {"Test", default_service_type}, loopback_any_port());
    ASSERT_TRUE(server.async_start());

    auto result = probe(server.port());
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->alive);
    EXPECT_EQ(result->server_time.size(), std::string("2026-01-01T00:00:00.000Z").size());
    EXPECT_EQ(result->server_time.back(), 'Z');
}

TEST_F(HttpLivenessProberTest, RejectsClosedPort)
{
    unsigned short port = 0;
    {
        tcp::acceptor acceptor(io_context, loopback_any_port());
        port = acceptor.local_endpoint().port();
    }

    auto result = probe(port);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->alive);
}

TEST_F(HttpLivenessProberTest, SilentServerTimesOut)
{
    // Connections complete in the listen backlog but nobody ever answers.
    tcp::acceptor acceptor(io_context, loopback_any_port());

    const auto started = std::chrono::steady_clock::now();
    auto result        = probe(acceptor.local_endpoint().port(), 150ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->alive);
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(HttpLivenessProberTest, HandlerRunsExactlyOnce)
{
    HealthServer server(io_context, {"Test", default_service_type}, loopback_any_port());
    ASSERT_TRUE(server.async_start());

    int calls = 0;
    prober.async_probe(*Endpoint::from_host_port("127.0.0.1", server.port()), 100ms, [&calls](const HealthResult&) { ++calls; });
    run_for(io_context, 300ms);

    EXPECT_EQ(calls, 1);
}

TEST(HttpLivenessInterpretTest, RequiresOkTrue)
{
    EXPECT_TRUE(HttpLivenessProber::interpret_response(200, R"({"ok":true})").alive);
    EXPECT_EQ(HttpLivenessProber::interpret_response(200, R"({"ok":true,"time":"2026-01-01T00:00:00.000Z"})").server_time,
              "2026-01-01T00:00:00.000Z");

    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, R"({"ok":false})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, R"({"ok":"true"})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, R"({"ok":1})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, R"({})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, R"([true])").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, "<html>ok</html>").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(200, "").alive);
}

TEST(HttpLivenessInterpretTest, RequiresStatus200)
{
    EXPECT_FALSE(HttpLivenessProber::interpret_response(204, R"({"ok":true})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(404, R"({"ok":true})").alive);
    EXPECT_FALSE(HttpLivenessProber::interpret_response(500, R"({"ok":true})").alive);
}
