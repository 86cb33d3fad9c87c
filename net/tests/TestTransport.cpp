/**
 * @file TestTransport.cpp
 * @brief Unit tests for addresses and the datagram transports.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/transport/MemoryTransport.hpp"
#include "rwn/net/transport/PeerAddress.hpp"
#include "rwn/net/transport/ThreadedTransport.hpp"
#include "rwn/net/transport/UdpTransport.hpp"
#include "rwn/core/Constants.hpp"
#include "rwn/core/Clock.hpp"

#include <array>
#include <chrono>
#include <set>
#include <thread>

namespace rwn::net::transport {

namespace {

const PeerAddress kAddrA = PeerAddress::ipv4(10, 0, 0, 1, 7000);
const PeerAddress kAddrB = PeerAddress::ipv4(10, 0, 0, 2, 7000);

std::array<core::byte, 3> payload(core::u8 tag)
{
    return {core::byte{tag}, core::byte{0xAB}, core::byte{0xCD}};
}

} // namespace

TEST_CASE("PeerAddress parses dotted quads with a port", "[net][transport]")
{
    const auto parsed = PeerAddress::parse("192.168.1.20:7000");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == PeerAddress::ipv4(192, 168, 1, 20, 7000));
    CHECK(parsed->toString() == "192.168.1.20:7000");

    for (const auto *text : {"192.168.1:7000", "1.2.3.4", "1.2.3.4:", "256.1.1.1:80", "1.2.3.4:70000",
                             "a.b.c.d:1", "1.2.3.4.5:80", "1..3.4:80", ""})
    {
        const auto bad = PeerAddress::parse(text);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code() == core::ErrorCode::kInvalidConfig);
    }
}

TEST_CASE("PeerAddress orders by host then port", "[net][transport]")
{
    CHECK(PeerAddress::ipv4(10, 0, 0, 1, 9000) < PeerAddress::ipv4(10, 0, 0, 2, 1));
    CHECK(PeerAddress::ipv4(10, 0, 0, 1, 1) < PeerAddress::ipv4(10, 0, 0, 1, 2));
}

TEST_CASE("MemoryNetwork delivers after the configured latency", "[net][transport]")
{
    core::ManualClock clock;
    MemoryNetwork network{clock, 3};
    MemoryTransport a{network, kAddrA};
    MemoryTransport b{network, kAddrB};
    REQUIRE(a.open().has_value());
    REQUIRE(b.open().has_value());
    network.setConditions({.latencyMs = 30, .jitterMs = 0, .lossRate = 0.0, .duplicateRate = 0.0});

    REQUIRE(a.sendTo(payload(1), kAddrB).value() == 3);

    std::array<core::byte, 64> buffer{};
    PeerAddress from;
    clock.advance(29);
    CHECK(b.receiveFrom(buffer, from).value() == 0);

    clock.advance(1);
    CHECK(b.receiveFrom(buffer, from).value() == 3);
    CHECK(from == kAddrA);
    CHECK(buffer[0] == core::byte{1});
    CHECK(network.stats().delivered == 1);
}

TEST_CASE("MemoryNetwork applies loss, duplication and partitions", "[net][transport]")
{
    core::ManualClock clock;
    MemoryNetwork network{clock, 3};
    MemoryTransport a{network, kAddrA};
    MemoryTransport b{network, kAddrB};
    REQUIRE(a.open().has_value());
    REQUIRE(b.open().has_value());

    std::array<core::byte, 64> buffer{};
    PeerAddress from;

    SECTION("loss")
    {
        network.setConditions({.latencyMs = 0, .jitterMs = 0, .lossRate = 1.0, .duplicateRate = 0.0});
        REQUIRE(a.sendTo(payload(1), kAddrB).has_value());
        CHECK(b.receiveFrom(buffer, from).value() == 0);
        CHECK(network.stats().dropped == 1);
    }

    SECTION("duplication")
    {
        network.setConditions({.latencyMs = 0, .jitterMs = 0, .lossRate = 0.0, .duplicateRate = 1.0});
        REQUIRE(a.sendTo(payload(1), kAddrB).has_value());
        CHECK(b.receiveFrom(buffer, from).value() == 3);
        CHECK(b.receiveFrom(buffer, from).value() == 3);
        CHECK(b.receiveFrom(buffer, from).value() == 0);
    }

    SECTION("partition in both directions")
    {
        network.setPartitioned(kAddrA, kAddrB, true);
        REQUIRE(a.sendTo(payload(1), kAddrB).has_value());
        REQUIRE(b.sendTo(payload(2), kAddrA).has_value());
        CHECK(b.receiveFrom(buffer, from).value() == 0);
        CHECK(a.receiveFrom(buffer, from).value() == 0);

        network.setPartitioned(kAddrA, kAddrB, false);
        REQUIRE(a.sendTo(payload(3), kAddrB).has_value());
        CHECK(b.receiveFrom(buffer, from).value() == 3);
    }

    SECTION("undersized receive buffer")
    {
        REQUIRE(a.sendTo(payload(1), kAddrB).has_value());
        std::array<core::byte, 2> small{};
        const auto received = b.receiveFrom(small, from);
        REQUIRE_FALSE(received.has_value());
        CHECK(received.error().code() == core::ErrorCode::kInvalidRequest);
    }
}

TEST_CASE("MemoryNetwork refuses a second binding", "[net][transport]")
{
    core::ManualClock clock;
    MemoryNetwork network{clock};
    MemoryTransport first{network, kAddrA};
    MemoryTransport second{network, kAddrA};
    REQUIRE(first.open().has_value());

    const auto opened = second.open();
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("ThreadedTransport hands over datagrams from its I/O thread", "[net][transport]")
{
    core::ManualClock clock;
    MemoryNetwork network{clock};
    MemoryTransport sender{network, kAddrA};
    MemoryTransport receiver{network, kAddrB};
    ThreadedTransport threaded{receiver};
    REQUIRE(sender.open().has_value());
    REQUIRE(threaded.open().has_value());

    constexpr core::u8 kCount = 50;
    for (core::u8 i = 0; i < kCount; ++i)
        REQUIRE(sender.sendTo(payload(i), kAddrB).has_value());

    std::set<core::u8> seen;
    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    PeerAddress from;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (seen.size() < kCount && std::chrono::steady_clock::now() < deadline)
    {
        const auto received = threaded.receiveFrom(buffer, from);
        REQUIRE(received.has_value());
        if (*received == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
            continue;
        }
        CHECK(*received == 3);
        CHECK(from == kAddrA);
        seen.insert(static_cast<core::u8>(buffer[0]));
    }

    CHECK(seen.size() == kCount);
    CHECK(threaded.overflowCount() == 0);
    threaded.close();
}

TEST_CASE("MemoryTransport skips empty datagrams queued before real ones", "[net][transport]")
{
    core::ManualClock clock;
    MemoryNetwork network{clock};
    MemoryTransport sender{network, kAddrA};
    MemoryTransport receiver{network, kAddrB};
    REQUIRE(sender.open().has_value());
    REQUIRE(receiver.open().has_value());

    REQUIRE(sender.sendTo(std::span<const core::byte>{}, kAddrB).value() == 0);
    REQUIRE(sender.sendTo(std::span<const core::byte>{}, kAddrB).value() == 0);
    REQUIRE(sender.sendTo(payload(9), kAddrB).has_value());

    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    PeerAddress from;
    const auto received = receiver.receiveFrom(buffer, from);
    REQUIRE(received.has_value());
    CHECK(*received == 3);
    CHECK(buffer[0] == core::byte{9});
    CHECK(receiver.receiveFrom(buffer, from).value() == 0);
}

TEST_CASE("UdpTransport exchanges datagrams over loopback", "[net][transport][udp]")
{
    UdpTransport a{0};
    UdpTransport b{0};
    REQUIRE(a.open().has_value());
    REQUIRE(b.open().has_value());
    REQUIRE(b.localPort() != 0);

    const auto target = PeerAddress::ipv4(127, 0, 0, 1, b.localPort());
    REQUIRE(a.sendTo(payload(7), target).value() == 3);

    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    PeerAddress from;
    core::u32 received = 0;
    for (int i = 0; i < 500 && received == 0; ++i)
    {
        const auto result = b.receiveFrom(buffer, from);
        REQUIRE(result.has_value());
        received = *result;
        if (received == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }

    CHECK(received == 3);
    CHECK(buffer[0] == core::byte{7});
    CHECK(from.port == a.localPort());
    a.close();
    b.close();
}

TEST_CASE("UdpTransport skips zero-length datagrams", "[net][transport][udp]")
{
    UdpTransport a{0};
    UdpTransport b{0};
    REQUIRE(a.open().has_value());
    REQUIRE(b.open().has_value());

    const auto target = PeerAddress::ipv4(127, 0, 0, 1, b.localPort());
    REQUIRE(a.sendTo(std::span<const core::byte>{}, target).has_value());
    REQUIRE(a.sendTo(payload(5), target).has_value());

    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    PeerAddress from;
    core::u32 received = 0;
    for (int i = 0; i < 500 && received == 0; ++i)
    {
        const auto result = b.receiveFrom(buffer, from);
        REQUIRE(result.has_value());
        received = *result;
        if (received == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }

    CHECK(received == 3);
    CHECK(buffer[0] == core::byte{5});
    a.close();
    b.close();
}

} // namespace rwn::net::transport
