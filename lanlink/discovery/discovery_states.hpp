#pragma once

#include <cstdint>

namespace lanlink
{

/// Outstanding work of a multicast socket owner (listener or publisher).
enum class MulticastSocketState : std::uint8_t
{
    running,
    stopping,
    failed,
    timer_running,
    sending_async,
    receiving_async,
};

} // namespace lanlink
