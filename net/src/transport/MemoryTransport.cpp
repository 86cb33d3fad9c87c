/**
 * @file MemoryTransport.cpp
 * @brief MemoryNetwork routing and the MemoryTransport endpoint.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/transport/MemoryTransport.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::transport {

// -------------------------------------------------------------------------- //
//  MemoryNetwork                                                             //
// -------------------------------------------------------------------------- //

MemoryNetwork::MemoryNetwork(const core::IClock &clock, core::u64 seed)
    : clock_(clock), rng_(seed)
{}

void MemoryNetwork::setConditions(const LinkConditions &conditions)
{
    std::lock_guard lock{mutex_};
    conditions_ = conditions;
}

void MemoryNetwork::setPartitioned(const PeerAddress &a, const PeerAddress &b, bool partitioned)
{
    std::lock_guard lock{mutex_};
    const auto key = std::minmax(a, b);
    if (partitioned)
        partitions_.emplace(key.first, key.second);
    else
        partitions_.erase({key.first, key.second});
}

MemoryNetworkStats MemoryNetwork::stats() const
{
    std::lock_guard lock{mutex_};
    return stats_;
}

core::Expected<void> MemoryNetwork::bind(const PeerAddress &address)
{
    std::lock_guard lock{mutex_};
    if (!inboxes_.try_emplace(address).second)
        return core::makeError(core::ErrorCode::kInvalidState,
                               std::format("address {} already bound", address.toString()));
    return {};
}

void MemoryNetwork::unbind(const PeerAddress &address)
{
    std::lock_guard lock{mutex_};
    inboxes_.erase(address);
}

bool MemoryNetwork::chance(core::f64 probability)
{
    if (probability <= 0.0)
        return false;
    std::uniform_real_distribution<core::f64> dist{0.0, 1.0};
    return dist(rng_) < probability;
}

void MemoryNetwork::enqueue(const PeerAddress &from, const PeerAddress &to, std::span<const core::byte> data)
{
    auto it = inboxes_.find(to);
    if (it == inboxes_.end())
    {
        ++stats_.dropped;
        return;
    }
    core::u64 delay = conditions_.latencyMs;
    if (conditions_.jitterMs > 0)
        delay += std::uniform_int_distribution<core::u64>{0, conditions_.jitterMs}(rng_);
    it->second.emplace(clock_.nowMs() + delay, InFlight{from, {data.begin(), data.end()}});
}

void MemoryNetwork::send(const PeerAddress &from, const PeerAddress &to, std::span<const core::byte> data)
{
    std::lock_guard lock{mutex_};
    ++stats_.sent;

    const auto key = std::minmax(from, to);
    if (partitions_.contains({key.first, key.second}) || chance(conditions_.lossRate))
    {
        ++stats_.dropped;
        return;
    }

    enqueue(from, to, data);
    if (chance(conditions_.duplicateRate))
    {
        ++stats_.duplicated;
        enqueue(from, to, data);
    }
}

core::Expected<core::u32> MemoryNetwork::receive(const PeerAddress &at, std::span<core::byte> buffer,
                                                 PeerAddress &from)
{
    std::lock_guard lock{mutex_};
    auto inbox = inboxes_.find(at);
    if (inbox == inboxes_.end())
        return core::makeError(core::ErrorCode::kInvalidState,
                               std::format("address {} not bound", at.toString()));

    auto &queue = inbox->second;
    // Empty datagrams are consumed in place; 0 only means nothing is due.
    while (!queue.empty() && queue.begin()->first <= clock_.nowMs() && queue.begin()->second.bytes.empty())
    {
        queue.erase(queue.begin());
        ++stats_.delivered;
    }
    if (queue.empty() || queue.begin()->first > clock_.nowMs())
        return core::u32{0};

    auto node = queue.extract(queue.begin());
    const auto &datagram = node.mapped();
    if (datagram.bytes.size() > buffer.size())
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("datagram of {} bytes exceeds receive buffer of {}",
                                           datagram.bytes.size(), buffer.size()));

    std::ranges::copy(datagram.bytes, buffer.begin());
    from = datagram.from;
    ++stats_.delivered;
    return static_cast<core::u32>(datagram.bytes.size());
}

// -------------------------------------------------------------------------- //
//  MemoryTransport                                                           //
// -------------------------------------------------------------------------- //

MemoryTransport::MemoryTransport(MemoryNetwork &network, PeerAddress address)
    : network_(network), address_(address)
{}

MemoryTransport::~MemoryTransport()
{
    close();
}

core::Expected<void> MemoryTransport::open()
{
    if (open_)
        return {};
    RWN_TRY_VOID(network_.bind(address_));
    open_ = true;
    core::Log::debug("MemoryTransport", std::format("bound {}", address_.toString()));
    return {};
}

void MemoryTransport::close()
{
    if (!open_)
        return;
    network_.unbind(address_);
    open_ = false;
}

core::Expected<core::u32> MemoryTransport::sendTo(std::span<const core::byte> data, const PeerAddress &address)
{
    if (!open_)
        return core::makeError(core::ErrorCode::kInvalidState, "transport not open");
    network_.send(address_, address, data);
    return static_cast<core::u32>(data.size());
}

core::Expected<core::u32> MemoryTransport::receiveFrom(std::span<core::byte> buffer, PeerAddress &from)
{
    if (!open_)
        return core::makeError(core::ErrorCode::kInvalidState, "transport not open");
    return network_.receive(address_, buffer, from);
}

const char *MemoryTransport::name() const noexcept
{
    return "MemoryTransport";
}

} // namespace rwn::net::transport
