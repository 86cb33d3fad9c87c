/**
 * @file UdpTransport.hpp
 * @brief Standard POSIX UDP socket transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWN_NET_TRANSPORT_UDPTRANSPORT_HPP
    #define RWN_NET_TRANSPORT_UDPTRANSPORT_HPP

#include <rwn/net/transport/ITransport.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <memory>

namespace rwn::net::transport {

/**
 * @class UdpTransport
 * @brief POSIX UDP socket-based transport (non-blocking).
 *
 * Binds to a local port on @ref open and uses @c sendto / @c recvfrom
 * for datagram exchange. Port 0 lets the system pick one; @ref localPort
 * reports the result.
 */
class UdpTransport final : public ITransport,
                           public core::NonCopyable<UdpTransport>
{
public:
    /**
     * @brief Constructs a socket transport bound to the given port.
     * @param port Local UDP port.
     */
    explicit UdpTransport(core::u16 port);
    ~UdpTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> sendTo(std::span<const core::byte> data,
                                                   const PeerAddress &address) override;

    [[nodiscard]] core::Expected<core::u32> receiveFrom(std::span<core::byte> buffer,
                                                        PeerAddress &from) override;

    [[nodiscard]] const char *name() const noexcept override;

    /// @brief Bound port, valid after a successful @ref open.
    [[nodiscard]] core::u16 localPort() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rwn::net::transport

#endif // RWN_NET_TRANSPORT_UDPTRANSPORT_HPP
