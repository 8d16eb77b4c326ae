#pragma once

#include "lanlink/net/endpoint.hpp"
#include "lanlink/net/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lanlink
{

enum class ConnectionStateKind : std::uint8_t
{
    idle,
    searching,
    probing,
    connected
};

inline const char* to_string(ConnectionStateKind kind) noexcept
{
    switch (kind)
    {
    case ConnectionStateKind::idle:
        return "idle";
    case ConnectionStateKind::searching:
        return "searching";
    case ConnectionStateKind::probing:
        return "probing";
    case ConnectionStateKind::connected:
        return "connected";
    }
    return "unknown";
}

/// Guidance shown next to the state while searching.
enum class StatusHint : std::uint8_t
{
    none,
    try_code
};

/**
 * @brief Snapshot of the reconciler's connection state.
 *
 * candidate is set only while probing and endpoint only while connected. last_failure
 * records why the most recent attempt did not connect; it never makes the state terminal.
 */
struct ConnectionState
{
    ConnectionStateKind kind = ConnectionStateKind::idle;
    std::optional<Candidate> candidate;
    std::optional<Endpoint> endpoint;
    StatusHint hint            = StatusHint::none;
    FailureReason last_failure = FailureReason::none;
    bool storage_warning       = false; ///< Connected, but the endpoint could not be persisted
    std::uint64_t epoch        = 0;

    bool is_connected() const noexcept { return kind == ConnectionStateKind::connected; }

    /// Searching or probing: a cycle is in progress.
    bool is_searching() const noexcept { return kind == ConnectionStateKind::searching || kind == ConnectionStateKind::probing; }
};

/**
 * The human readable status line for a state. Always one of: "Not connected",
 * "Searching for server...", "Server not found. Scan a code to connect.",
 * "Validating <endpoint>...", "Connected to <endpoint>".
 */
std::string status_line(const ConnectionState& state);

} // namespace lanlink
