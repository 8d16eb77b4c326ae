#include "lanlink/cli/cli_config.hpp"
#include "lanlink/cli/command_reader.hpp"
#include "lanlink/discovery/multicast_discovery_channel.hpp"
#include "lanlink/items/items_client.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/errors.hpp"
#include "lanlink/probe/http_liveness_prober.hpp"
#include "lanlink/reconcile/connection_reconciler.hpp"
#include "lanlink/store/file_endpoint_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/errors.hpp>

#include <csignal>
#include <iostream>
#include <string>

#include <unistd.h>

int main(int argc, char* argv[])
{
    lanlink::ClientConfig config;
    try
    {
        config = lanlink::parse_client_command_line(argc, argv);
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

    lanlink::FileEndpointStore store(config.store_directory);
    lanlink::HttpLivenessProber prober(io_context);
    lanlink::MulticastDiscoveryChannel discovery(io_context);

    lanlink::ReconcilerConfig reconciler_config;
    reconciler_config.service_type        = config.service_type;
    reconciler_config.probe_timeout       = config.probe_timeout;
    reconciler_config.discovery_window    = config.discovery_window;
    reconciler_config.revalidate_interval = config.revalidate_interval;

    lanlink::ConnectionReconciler reconciler(io_context, store, prober, discovery, reconciler_config);

    std::string last_status;
    reconciler.set_state_observer(
        [&](const lanlink::ConnectionState& state)
        {
            const std::string status = lanlink::status_line(state);
            if (status != last_status)
            {
                std::cout << status << std::endl;
                last_status = status;
            }
            if (state.storage_warning)
            {
                std::cout << "Warning: this server will not be remembered" << std::endl;
            }
            if (config.once && state.is_connected())
            {
                io_context.stop();
            }
        });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context](const boost::system::error_code&, int) { io_context.stop(); });

    if (config.forget)
    {
        reconciler.forget();
    }
    reconciler.start();

    if (config.code)
    {
        try
        {
            reconciler.submit_code(*config.code);
        }
        catch (const lanlink::InvalidCodeError& error)
        {
            std::cerr << "Invalid code: " << error.what() << '\n';
            return 2;
        }
    }

    lanlink::ItemsClient items(io_context, reconciler, config.probe_timeout);
    lanlink::CommandReader commands(io_context, reconciler, items, std::cout);
    if (commands.attach(STDIN_FILENO))
    {
        commands.start();
    }
    else
    {
        LANLINK_LOG_WARNING("Continuing without interactive commands");
    }

    io_context.run();
    return 0;
}
