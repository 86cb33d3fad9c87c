// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadedTransport.hpp
/// @brief Decorator moving datagram reception onto an I/O thread.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/transport/ITransport.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <memory>

namespace rwn::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadedTransport
/// @brief Receives on a background thread into a lock-free queue.
///
/// The I/O thread drains the wrapped transport into an SPSC ring; the
/// session thread pops from it through @ref receiveFrom. Datagrams arriving
/// while the ring is full are dropped and counted. Sends go straight to the
/// wrapped transport on the caller's thread, which must therefore tolerate a
/// concurrent receive (UDP sockets and MemoryTransport do).
// /////////////////////////////////////////////////////////////////////////////
class ThreadedTransport final : public ITransport,
                                public core::NonCopyable<ThreadedTransport>
{
public:
    explicit ThreadedTransport(ITransport &inner);
    ~ThreadedTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> sendTo(std::span<const core::byte> data,
                                                   const PeerAddress &address) override;

    [[nodiscard]] core::Expected<core::u32> receiveFrom(std::span<core::byte> buffer,
                                                        PeerAddress &from) override;

    [[nodiscard]] const char *name() const noexcept override;

    /// @brief Datagrams discarded because the queue was full.
    [[nodiscard]] core::u64 overflowCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rwn::net::transport
