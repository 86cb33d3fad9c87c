/**
 * @file ThreadedTransport.cpp
 * @brief ThreadedTransport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/transport/ThreadedTransport.hpp>
#include <rwn/container/RingBuffer.hpp>
#include <rwn/core/Constants.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <thread>

namespace rwn::net::transport {

namespace {

struct Datagram
{
    PeerAddress                                 from;
    core::u16                                   size{0};
    std::array<core::byte, core::kMaxDatagramSize> bytes{};
};

constexpr core::usize kQueueCapacity = 128;
constexpr auto        kIdleSleep     = std::chrono::milliseconds{1};

} // namespace

struct ThreadedTransport::Impl
{
    ITransport                                          &inner;
    container::RingBuffer<Datagram, kQueueCapacity>     queue;
    std::thread                                         worker;
    std::atomic<bool>                                   stopping{false};
    std::atomic<core::u64>                              overflow{0};

    explicit Impl(ITransport &t) : inner(t) {}

    void ioLoop()
    {
        Datagram datagram;
        bool reportedError = false;
        while (!stopping.load(std::memory_order_acquire))
        {
            auto received = inner.receiveFrom(datagram.bytes, datagram.from);
            if (!received)
            {
                if (!reportedError)
                {
                    core::Log::warn("ThreadedTransport", received.error().describe());
                    reportedError = true;
                }
                std::this_thread::sleep_for(kIdleSleep);
                continue;
            }
            reportedError = false;
            if (*received == 0)
            {
                std::this_thread::sleep_for(kIdleSleep);
                continue;
            }
            datagram.size = static_cast<core::u16>(*received);
            if (!queue.push(datagram))
                overflow.fetch_add(1, std::memory_order_relaxed);
        }
    }
};

ThreadedTransport::ThreadedTransport(ITransport &inner)
    : impl_{std::make_unique<Impl>(inner)}
{}

ThreadedTransport::~ThreadedTransport()
{
    close();
}

core::Expected<void> ThreadedTransport::open()
{
    if (impl_->worker.joinable())
        return {};
    RWN_TRY_VOID(impl_->inner.open());
    impl_->stopping.store(false, std::memory_order_release);
    impl_->worker = std::thread(&Impl::ioLoop, impl_.get());
    core::Log::info("ThreadedTransport", std::format("receiving from {} on I/O thread", impl_->inner.name()));
    return {};
}

void ThreadedTransport::close()
{
    if (!impl_->worker.joinable())
        return;
    impl_->stopping.store(true, std::memory_order_release);
    impl_->worker.join();
    impl_->inner.close();
}

core::Expected<core::u32> ThreadedTransport::sendTo(std::span<const core::byte> data, const PeerAddress &address)
{
    return impl_->inner.sendTo(data, address);
}

core::Expected<core::u32> ThreadedTransport::receiveFrom(std::span<core::byte> buffer, PeerAddress &from)
{
    Datagram datagram;
    if (!impl_->queue.pop(datagram))
        return core::u32{0};
    if (datagram.size > buffer.size())
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("datagram of {} bytes exceeds receive buffer of {}",
                                           datagram.size, buffer.size()));
    std::copy_n(datagram.bytes.begin(), datagram.size, buffer.begin());
    from = datagram.from;
    return static_cast<core::u32>(datagram.size);
}

const char *ThreadedTransport::name() const noexcept
{
    return "ThreadedTransport";
}

core::u64 ThreadedTransport::overflowCount() const noexcept
{
    return impl_->overflow.load(std::memory_order_relaxed);
}

} // namespace rwn::net::transport
