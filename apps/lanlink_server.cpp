#include "lanlink/cli/cli_config.hpp"
#include "lanlink/code/code_channel.hpp"
#include "lanlink/discovery/advertisement_publisher.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/server/health_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/errors.hpp>

#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[])
{
    lanlink::ServerConfig config;
    try
    {
        config = lanlink::parse_server_command_line(argc, argv);
    }
    catch (const boost::program_options::error& error)
    {
        std::cerr << "Error: " << error.what() << '\n';
        return 1;
    }

    if (config.show_help)
    {
        std::cout << config.help_text;
        return 0;
    }
    lanlink::logging::current_log_level = config.log_level;

    boost::asio::io_context io_context;

    std::unique_ptr<lanlink::HealthServer> http_server;
    try
    {
        http_server = std::make_unique<lanlink::HealthServer>(
            io_context, lanlink::ServerIdentity {config.name, config.service_type},
            boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::any(), config.port));
    }
    catch (const boost::system::system_error& error)
    {
        LANLINK_LOG_ERROR("Cannot listen on port " << config.port << ": " << error.what());
        return 1;
    }
    http_server->async_start();

    lanlink::ServiceAdvertisement service;
    service.service_type = config.service_type;
    service.name         = config.name;
    service.port         = http_server->port();
    service.metadata     = config.metadata;

    lanlink::PublisherConfig publisher_config;
    publisher_config.announce_interval = config.announce_interval;

    lanlink::AdvertisementPublisher publisher(io_context, service, publisher_config);
    if (!publisher.async_start())
    {
        LANLINK_LOG_WARNING("Multicast discovery unavailable, clients must scan a code");
    }

    std::cout << "Codes for clients:" << std::endl;
    for (const auto& url : http_server->lan_urls())
    {
        if (auto endpoint = lanlink::Endpoint::parse(url))
        {
            std::cout << "  " << lanlink::CodeChannel::encode(*endpoint, {{"name", config.name}}) << std::endl;
        }
    }

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const boost::system::error_code& error_code, int)
        {
            if (error_code)
            {
                return;
            }
            LANLINK_LOG_INFO("Shutting down");
            publisher.async_stop([&]() { http_server->async_stop([&io_context]() { io_context.stop(); }); });
        });

    io_context.run();
    return 0;
}
