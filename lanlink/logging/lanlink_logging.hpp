#pragma once

#include <iostream>
#include <sstream>

namespace lanlink
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Global log level variable
extern LogLevel current_log_level;

inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace lanlink

#define LANLINK_SET_LOG_LEVEL(level) lanlink::logging::current_log_level = lanlink::logging::LogLevel::level

// All levels share one body; the level token selects the filter and the tag.
#define LANLINK_LOG_AT(level, message)                                                                                               \
    do                                                                                                                               \
    {                                                                                                                                \
        if (lanlink::logging::should_log(lanlink::logging::LogLevel::level))                                                         \
        {                                                                                                                            \
            std::ostringstream oss;                                                                                                  \
            oss << "[" << lanlink::logging::get_log_level_name(lanlink::logging::LogLevel::level) << "] " << __func__ << ": "         \
                << message << "\n";                                                                                                  \
            std::cout << oss.str();                                                                                                  \
        }                                                                                                                            \
    } while (0)

#define LANLINK_LOG_ERROR(message)   LANLINK_LOG_AT(Error, message)
#define LANLINK_LOG_WARNING(message) LANLINK_LOG_AT(Warning, message)
#define LANLINK_LOG_INFO(message)    LANLINK_LOG_AT(Info, message)
#define LANLINK_LOG_DEBUG(message)   LANLINK_LOG_AT(Debug, message)
#define LANLINK_LOG_TRACE(message)   LANLINK_LOG_AT(Trace, message)
