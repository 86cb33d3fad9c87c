/**
 * @file UdpTransport.cpp
 * @brief POSIX UDP socket transport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/transport/UdpTransport.hpp>
#include <rwn/core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rwn::net::transport {

namespace {

core::Unexpected ioError(const char *call)
{
    return core::makeError(core::ErrorCode::kIoError,
                           std::format("{} failed: {}", call, std::strerror(errno)));
}

} // namespace

struct UdpTransport::Impl
{
    core::u16 port;
    int       fd{-1};

    explicit Impl(core::u16 p) : port{p} {}
};

UdpTransport::UdpTransport(core::u16 port)
    : impl_{std::make_unique<Impl>(port)}
{}

UdpTransport::~UdpTransport()
{
    close();
}

core::Expected<void> UdpTransport::open()
{
    if (impl_->fd >= 0)
        return {};

    impl_->fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (impl_->fd < 0)
        return ioError("socket()");

    const int flags = ::fcntl(impl_->fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(impl_->fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        auto err = ioError("fcntl()");
        close();
        return err;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    if (::bind(impl_->fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
    {
        auto err = ioError("bind()");
        close();
        return err;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(impl_->fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
        impl_->port = ntohs(addr.sin_port);

    core::Log::info("UdpTransport", std::format("bound to port {}", impl_->port));
    return {};
}

void UdpTransport::close()
{
    if (impl_->fd >= 0)
    {
        ::close(impl_->fd);
        impl_->fd = -1;
    }
}

core::Expected<core::u32> UdpTransport::sendTo(std::span<const core::byte> data,
                                               const PeerAddress &address)
{
    if (impl_->fd < 0)
        return core::makeError(core::ErrorCode::kInvalidState, "socket not open");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    addr.sin_addr.s_addr = htonl(address.host);

    const auto sent = ::sendto(impl_->fd,
                               data.data(),
                               data.size(),
                               0,
                               reinterpret_cast<const sockaddr *>(&addr),
                               sizeof(addr));

    if (sent < 0)
    {
        if (errno == EWOULDBLOCK || errno == EAGAIN)
            return core::u32{0};
        return ioError("sendto()");
    }

    return static_cast<core::u32>(sent);
}

core::Expected<core::u32> UdpTransport::receiveFrom(std::span<core::byte> buffer, PeerAddress &from)
{
    if (impl_->fd < 0)
        return core::makeError(core::ErrorCode::kInvalidState, "socket not open");

    // Zero-length datagrams and stale ICMP errors are consumed and skipped so
    // that 0 keeps meaning "queue drained".
    for (;;)
    {
        sockaddr_in addr{};
        socklen_t addrLen = sizeof(addr);

        const auto received = ::recvfrom(impl_->fd,
                                         buffer.data(),
                                         buffer.size(),
                                         0,
                                         reinterpret_cast<sockaddr *>(&addr),
                                         &addrLen);

        if (received < 0)
        {
            if (errno == EWOULDBLOCK || errno == EAGAIN)
                return core::u32{0};
            // ICMP port unreachable from a peer that has not bound yet.
            if (errno == ECONNREFUSED)
                continue;
            return ioError("recvfrom()");
        }
        if (received == 0)
            continue;

        from = PeerAddress{ntohl(addr.sin_addr.s_addr), ntohs(addr.sin_port)};
        return static_cast<core::u32>(received);
    }
}

const char *UdpTransport::name() const noexcept
{
    return "UdpTransport";
}

core::u16 UdpTransport::localPort() const noexcept
{
    return impl_->port;
}

} // namespace rwn::net::transport
