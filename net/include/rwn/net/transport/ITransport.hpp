// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract datagram transport (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/transport/PeerAddress.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Types.hpp>

#include <span>

namespace rwn::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Unreliable, unordered datagram exchange.
///
/// Concrete implementations:
///   - @c UdpTransport      POSIX UDP sockets.
///   - @c MemoryTransport   in-process network with scripted loss and latency.
///   - @c ThreadedTransport receives on a background thread for any of the above.
///
/// Sessions only require that datagrams are delivered whole or not at all.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Opens the transport (bind, register, start threads).
    [[nodiscard]] virtual core::Expected<void> open() = 0;

    /// @brief Closes the transport. Idempotent.
    virtual void close() = 0;

    /// @brief Sends one datagram to @p address.
    /// @return Number of bytes sent, or error.
    [[nodiscard]] virtual core::Expected<core::u32> sendTo(std::span<const core::byte> data,
                                                           const PeerAddress &address) = 0;

    /// @brief Non-blocking receive of one datagram.
    /// @param[out] from Filled with the sender address when a datagram is returned.
    /// @return Number of bytes received (0 if nothing available), or error.
    [[nodiscard]] virtual core::Expected<core::u32> receiveFrom(std::span<core::byte> buffer,
                                                                PeerAddress &from) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

} // namespace rwn::net::transport
