#include "lanlink/reconcile/connection_state.hpp"

namespace lanlink
{

std::string status_line(const ConnectionState& state)
{
    switch (state.kind)
    {
    case ConnectionStateKind::idle:
        return "Not connected";
    case ConnectionStateKind::searching:
        if (state.hint == StatusHint::try_code)
        {
            return "Server not found. Scan a code to connect.";
        }
        return "Searching for server...";
    case ConnectionStateKind::probing:
        return "Validating " + (state.candidate ? state.candidate->endpoint.to_string() : std::string("server")) + "...";
    case ConnectionStateKind::connected:
        return "Connected to " + (state.endpoint ? state.endpoint->to_string() : std::string("server"));
    }
    return "Not connected";
}

} // namespace lanlink
