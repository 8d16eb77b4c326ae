#include "lanlink/cli/cli_config.hpp"

#include "lanlink/store/file_endpoint_store.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <sstream>
#include <vector>

namespace lanlink
{

namespace po = boost::program_options;

namespace
{

std::vector<std::string> to_arguments(int argc, const char* const argv[])
{
    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }
    return arguments;
}

// Verbosity flags are counted by hand; strip them before Program_options sees the line.
std::vector<std::string> without_verbosity(const std::vector<std::string>& arguments)
{
    std::vector<std::string> filtered;
    for (size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        const bool is_verbosity     = argument.size() >= 2 && argument[0] == '-' && argument.find_first_not_of('v', 1) == std::string::npos;
        if (!is_verbosity)
        {
            filtered.push_back(argument);
        }
    }
    return filtered;
}

std::string verbosity_help()
{
    return "\nVerbosity levels:\n"
           "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
           "  -v      : Debug level - adds DEBUG messages\n"
           "  -vv     : Trace level - shows all messages\n";
}

std::string describe(const po::options_description& description)
{
    std::ostringstream stream;
    stream << description << verbosity_help();
    return stream.str();
}

std::chrono::milliseconds positive_milliseconds(const po::variables_map& variables, const char* name, bool allow_zero)
{
    const long value = variables[name].as<long>();
    if (value < 0 || (value == 0 && !allow_zero))
    {
        throw po::error(std::string("--") + name + " must be " + (allow_zero ? "zero or positive" : "positive"));
    }
    return std::chrono::milliseconds(value);
}

} // namespace

logging::LogLevel log_level_from_arguments(int argc, const char* const argv[])
{
    const auto arguments = to_arguments(argc, argv);

    size_t verbosity = 0;
    for (size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        if (argument.size() >= 2 && argument[0] == '-' && argument.find_first_not_of('v', 1) == std::string::npos)
        {
            verbosity = std::max(verbosity, argument.size() - 1);
        }
    }

    if (verbosity == 0)
    {
        return logging::LogLevel::Info;
    }
    if (verbosity == 1)
    {
        return logging::LogLevel::Debug;
    }
    return logging::LogLevel::Trace;
}

ClientConfig parse_client_command_line(int argc, const char* const argv[])
{
    po::options_description description("LanLink client options");
    // clang-format off
    description.add_options()
        ("help,h", "Show help message")
        ("service-type,t", po::value<std::string>()->default_value(default_service_type), "Service type to discover")
        ("store-dir", po::value<std::string>(), "Directory holding the saved endpoint")
        ("code,c", po::value<std::string>(), "Scanned code payload, e.g. {\"baseUrl\":\"http://192.168.1.50:4310\"}")
        ("forget", "Forget the saved endpoint before connecting")
        ("once", "Exit as soon as a server is connected")
        ("probe-timeout-ms", po::value<long>()->default_value(4000), "Liveness probe timeout")
        ("discovery-window-ms", po::value<long>()->default_value(6000), "Time before suggesting a code")
        ("revalidate-ms", po::value<long>()->default_value(2000), "Re-probe interval while connected, 0 disables");
    // clang-format on

    ClientConfig config;
    config.log_level = log_level_from_arguments(argc, argv);

    po::variables_map variables;
    po::store(po::command_line_parser(without_verbosity(to_arguments(argc, argv))).options(description).run(), variables);
    po::notify(variables);

    if (variables.count("help") != 0U)
    {
        config.show_help = true;
        config.help_text = describe(description);
        return config;
    }

    config.service_type = variables["service-type"].as<std::string>();
    if (config.service_type.empty())
    {
        throw po::error("--service-type must not be empty");
    }

    config.store_directory =
        variables.count("store-dir") != 0U ? std::filesystem::path(variables["store-dir"].as<std::string>()) : FileEndpointStore::default_directory();
    if (variables.count("code") != 0U)
    {
        config.code = variables["code"].as<std::string>();
    }
    config.forget              = variables.count("forget") != 0U;
    config.once                = variables.count("once") != 0U;
    config.probe_timeout       = positive_milliseconds(variables, "probe-timeout-ms", false);
    config.discovery_window    = positive_milliseconds(variables, "discovery-window-ms", false);
    config.revalidate_interval = positive_milliseconds(variables, "revalidate-ms", true);

    return config;
}

ServerConfig parse_server_command_line(int argc, const char* const argv[])
{
    po::options_description description("LanLink server options");
    // clang-format off
    description.add_options()
        ("help,h", "Show help message")
        ("name,n", po::value<std::string>()->default_value("LanLink Server"), "Advertised service name")
        ("service-type,t", po::value<std::string>()->default_value(default_service_type), "Advertised service type")
        ("port,p", po::value<unsigned short>()->default_value(HealthServer::default_port), "HTTP port")
        ("txt", po::value<std::vector<std::string>>()->composing(), "Advertisement metadata as key=value (repeatable)")
        ("announce-ms", po::value<long>()->default_value(5000), "Interval between unsolicited announcements");
    // clang-format on

    ServerConfig config;
    config.log_level = log_level_from_arguments(argc, argv);

    po::variables_map variables;
    po::store(po::command_line_parser(without_verbosity(to_arguments(argc, argv))).options(description).run(), variables);
    po::notify(variables);

    if (variables.count("help") != 0U)
    {
        config.show_help = true;
        config.help_text = describe(description);
        return config;
    }

    config.name         = variables["name"].as<std::string>();
    config.service_type = variables["service-type"].as<std::string>();
    if (config.service_type.empty())
    {
        throw po::error("--service-type must not be empty");
    }
    config.port              = variables["port"].as<unsigned short>();
    config.announce_interval = positive_milliseconds(variables, "announce-ms", false);

    if (variables.count("txt") != 0U)
    {
        for (const auto& entry : variables["txt"].as<std::vector<std::string>>())
        {
            const auto separator = entry.find('=');
            if (separator == std::string::npos || separator == 0)
            {
                throw po::error("--txt expects key=value, got '" + entry + "'");
            }
            config.metadata[entry.substr(0, separator)] = entry.substr(separator + 1);
        }
    }

    return config;
}

} // namespace lanlink
