#pragma once

#include "lanlink/discovery/service_advertisement.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/server/health_server.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace lanlink
{

struct ClientConfig
{
    std::string service_type = default_service_type;
    std::filesystem::path store_directory;
    std::optional<std::string> code;
    bool forget = false;
    bool once   = false;
    std::chrono::milliseconds probe_timeout {4000};
    std::chrono::milliseconds discovery_window {6000};
    std::chrono::milliseconds revalidate_interval {2000};
    logging::LogLevel log_level = logging::LogLevel::Info;
    bool show_help              = false;
    std::string help_text;
};

struct ServerConfig
{
    std::string name         = "LanLink Server";
    std::string service_type = default_service_type;
    unsigned short port      = HealthServer::default_port;
    std::map<std::string, std::string> metadata;
    std::chrono::milliseconds announce_interval {5000};
    logging::LogLevel log_level = logging::LogLevel::Info;
    bool show_help              = false;
    std::string help_text;
};

/**
 * Parse the client command line.
 * @throws boost::program_options::error on invalid input
 */
ClientConfig parse_client_command_line(int argc, const char* const argv[]);

/**
 * Parse the server command line.
 * @throws boost::program_options::error on invalid input
 */
ServerConfig parse_server_command_line(int argc, const char* const argv[]);

/// -v selects Debug, -vv (or more) Trace; no flag keeps Info.
logging::LogLevel log_level_from_arguments(int argc, const char* const argv[]);

} // namespace lanlink
