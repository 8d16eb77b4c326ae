#include "lanlink/logging/lanlink_logging.hpp"

namespace lanlink
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

} // namespace logging
} // namespace lanlink
