// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryTransport.hpp
/// @brief In-process datagram network with scripted link conditions.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/transport/ITransport.hpp>
#include <rwn/core/Clock.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <map>
#include <mutex>
#include <random>
#include <set>
#include <vector>

namespace rwn::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @struct LinkConditions
/// @brief Impairments applied to every datagram crossing a MemoryNetwork.
///
/// Jitter is drawn uniformly in [0, jitterMs] per datagram, so any non-zero
/// jitter also reorders traffic.
// /////////////////////////////////////////////////////////////////////////////
struct LinkConditions
{
    core::u64 latencyMs{0};
    core::u64 jitterMs{0};
    core::f64 lossRate{0.0};
    core::f64 duplicateRate{0.0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct MemoryNetworkStats
/// @brief Datagram counters of a MemoryNetwork.
// /////////////////////////////////////////////////////////////////////////////
struct MemoryNetworkStats
{
    core::u64 sent{0};
    core::u64 dropped{0};
    core::u64 duplicated{0};
    core::u64 delivered{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class MemoryNetwork
/// @brief Hub routing datagrams between MemoryTransport endpoints.
///
/// Delivery time is read from the injected clock, so a ManualClock makes
/// latency, loss and reordering fully reproducible for a given seed.
/// Thread-safe.
// /////////////////////////////////////////////////////////////////////////////
class MemoryNetwork final : public core::NonCopyable<MemoryNetwork>
{
public:
    explicit MemoryNetwork(const core::IClock &clock, core::u64 seed = 0);

    void setConditions(const LinkConditions &conditions);

    /// @brief Drops all traffic between @p a and @p b in both directions.
    void setPartitioned(const PeerAddress &a, const PeerAddress &b, bool partitioned);

    [[nodiscard]] MemoryNetworkStats stats() const;

    /// @return kInvalidState if @p address is already bound.
    [[nodiscard]] core::Expected<void> bind(const PeerAddress &address);
    void unbind(const PeerAddress &address);

    void send(const PeerAddress &from, const PeerAddress &to, std::span<const core::byte> data);

    /// @brief Pops the earliest datagram due for @p at.
    /// @return Size of the datagram, 0 when none is due, kInvalidRequest if
    ///         @p buffer is too small (the datagram is discarded).
    [[nodiscard]] core::Expected<core::u32> receive(const PeerAddress &at, std::span<core::byte> buffer,
                                                    PeerAddress &from);

private:
    struct InFlight
    {
        PeerAddress             from;
        std::vector<core::byte> bytes;
    };

    [[nodiscard]] bool chance(core::f64 probability);
    void enqueue(const PeerAddress &from, const PeerAddress &to, std::span<const core::byte> data);

    const core::IClock                                          &clock_;
    mutable std::mutex                                           mutex_;
    std::mt19937_64                                              rng_;
    LinkConditions                                               conditions_;
    MemoryNetworkStats                                           stats_;
    std::map<PeerAddress, std::multimap<core::u64, InFlight>>    inboxes_;
    std::set<std::pair<PeerAddress, PeerAddress>>                partitions_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class MemoryTransport
/// @brief ITransport endpoint attached to a MemoryNetwork.
// /////////////////////////////////////////////////////////////////////////////
class MemoryTransport final : public ITransport,
                              public core::NonCopyable<MemoryTransport>
{
public:
    MemoryTransport(MemoryNetwork &network, PeerAddress address);
    ~MemoryTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> sendTo(std::span<const core::byte> data,
                                                   const PeerAddress &address) override;

    [[nodiscard]] core::Expected<core::u32> receiveFrom(std::span<core::byte> buffer,
                                                        PeerAddress &from) override;

    [[nodiscard]] const char *name() const noexcept override;

    [[nodiscard]] const PeerAddress &address() const noexcept { return address_; }

private:
    MemoryNetwork &network_;
    PeerAddress    address_;
    bool           open_{false};
};

} // namespace rwn::net::transport
