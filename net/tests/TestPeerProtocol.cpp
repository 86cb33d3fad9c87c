/**
 * @file TestPeerProtocol.cpp
 * @brief Unit tests for protocol::PeerProtocol over an in-memory network.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/protocol/PeerProtocol.hpp"
#include "rwn/net/transport/MemoryTransport.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <memory>

namespace rwn::net::protocol {

namespace {

const transport::PeerAddress kAddrA = transport::PeerAddress::ipv4(10, 0, 0, 1, 7000);
const transport::PeerAddress kAddrB = transport::PeerAddress::ipv4(10, 0, 0, 2, 7000);

PeerProtocolParams paramsFor(core::u32 remoteHandle, const transport::PeerAddress &remote, core::u64 seed)
{
    PeerProtocolParams params;
    params.handles = {core::PlayerHandle{remoteHandle}};
    params.address = remote;
    params.numPlayers = 2;
    params.localPlayers = 1;
    params.inputSize = 1;
    params.maxPrediction = 8;
    params.seed = seed;
    params.desync = DesyncDetection::on(10);
    return params;
}

/// A sees B as player 1, B sees A as player 0.
struct Link
{
    core::ManualClock                        clock;
    transport::MemoryNetwork                 network{clock, 99};
    transport::MemoryTransport               transportA{network, kAddrA};
    transport::MemoryTransport               transportB{network, kAddrB};
    std::unique_ptr<PeerProtocol>            a;
    std::unique_ptr<PeerProtocol>            b;
    std::array<netcode::ConnectionStatus, 2> statuses{};
    std::vector<PeerEvent>                   eventsA;
    std::vector<PeerEvent>                   eventsB;

    explicit Link(PeerProtocolParams paramsA = paramsFor(1, kAddrB, 1),
                  PeerProtocolParams paramsB = paramsFor(0, kAddrA, 2))
    {
        REQUIRE(transportA.open().has_value());
        REQUIRE(transportB.open().has_value());
        a = std::make_unique<PeerProtocol>(std::move(paramsA), clock);
        b = std::make_unique<PeerProtocol>(std::move(paramsB), clock);
    }

    static void receiveAll(PeerProtocol &peer, transport::MemoryTransport &transport)
    {
        std::array<core::byte, core::kMaxDatagramSize> buffer{};
        transport::PeerAddress from;
        for (;;)
        {
            const auto received = transport.receiveFrom(buffer, from);
            REQUIRE(received.has_value());
            if (*received == 0)
                return;
            const auto message = decodeMessage(std::span{buffer}.first(*received));
            REQUIRE(message.has_value());
            if (peer.isHandlingMessage(from))
                peer.handleMessage(*message);
        }
    }

    void pump()
    {
        REQUIRE(a->flush(transportA).has_value());
        REQUIRE(b->flush(transportB).has_value());
        receiveAll(*a, transportA);
        receiveAll(*b, transportB);
        for (auto &e : a->poll(statuses))
            eventsA.push_back(std::move(e));
        for (auto &e : b->poll(statuses))
            eventsB.push_back(std::move(e));
    }

    void synchronize()
    {
        a->synchronize();
        b->synchronize();
        for (int i = 0; i < 20 && !(a->isRunning() && b->isRunning()); ++i)
            pump();
        REQUIRE(a->isRunning());
        REQUIRE(b->isRunning());
        eventsA.clear();
        eventsB.clear();
    }

    template <typename Event>
    static core::usize count(const std::vector<PeerEvent> &events)
    {
        core::usize n = 0;
        for (const auto &e : events)
            n += std::holds_alternative<Event>(e) ? 1 : 0;
        return n;
    }

    static std::vector<event::Input> inputs(const std::vector<PeerEvent> &events)
    {
        std::vector<event::Input> out;
        for (const auto &e : events)
            if (const auto *input = std::get_if<event::Input>(&e))
                out.push_back(*input);
        return out;
    }
};

std::array<core::byte, 1> input(core::u8 value)
{
    return {core::byte{value}};
}

} // namespace

TEST_CASE("PeerProtocol handshake completes after every round trip", "[protocol][peer]")
{
    Link link;
    link.a->synchronize();
    link.b->synchronize();
    REQUIRE(link.a->state() == PeerState::Synchronizing);

    for (int i = 0; i < 20 && !(link.a->isRunning() && link.b->isRunning()); ++i)
        link.pump();

    REQUIRE(link.a->isRunning());
    REQUIRE(link.b->isRunning());
    REQUIRE(Link::count<event::Synchronizing>(link.eventsA) == core::kNumSyncPackets - 1);
    REQUIRE(Link::count<event::Synchronized>(link.eventsA) == 1);
    REQUIRE(Link::count<event::Synchronized>(link.eventsB) == 1);
}

TEST_CASE("PeerProtocol retries the handshake when requests are lost", "[protocol][peer]")
{
    Link link;
    link.network.setPartitioned(kAddrA, kAddrB, true);
    link.a->synchronize();
    link.b->synchronize();
    link.pump();
    REQUIRE(link.a->state() == PeerState::Synchronizing);

    link.network.setPartitioned(kAddrA, kAddrB, false);
    for (int i = 0; i < 40 && !(link.a->isRunning() && link.b->isRunning()); ++i)
    {
        link.clock.advance(core::kSyncRetryIntervalMs + 1);
        link.pump();
    }
    REQUIRE(link.a->isRunning());
    REQUIRE(link.b->isRunning());
}

TEST_CASE("PeerProtocol ignores replies to long superseded handshake requests", "[protocol][peer]")
{
    Link link;
    link.a->synchronize();
    REQUIRE(link.a->flush(link.transportA).has_value());

    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    transport::PeerAddress from;
    const auto received = link.transportB.receiveFrom(buffer, from);
    REQUIRE(received.has_value());
    REQUIRE(*received > 0);
    const auto first = decodeMessage(std::span{buffer}.first(*received));
    REQUIRE(first.has_value());
    const auto *request = std::get_if<SyncRequest>(&first->body);
    REQUIRE(request != nullptr);

    // B stays silent while A keeps retrying.
    for (int i = 0; i < 30; ++i)
    {
        link.clock.advance(core::kSyncRetryIntervalMs + 1);
        (void)link.a->poll(link.statuses);
        REQUIRE(link.a->flush(link.transportA).has_value());
        for (;;)
        {
            const auto drained = link.transportB.receiveFrom(buffer, from);
            REQUIRE(drained.has_value());
            if (*drained == 0)
                break;
        }
    }

    link.a->handleMessage(Message{MessageHeader{0x1234, core::kProtocolVersion}, SyncReply{request->randomRequest}});
    CHECK(Link::count<event::Synchronizing>(link.a->poll(link.statuses)) == 0);
    CHECK(link.a->state() == PeerState::Synchronizing);

    link.b->synchronize();
    for (int i = 0; i < 40 && !(link.a->isRunning() && link.b->isRunning()); ++i)
    {
        link.clock.advance(core::kSyncRetryIntervalMs + 1);
        link.pump();
    }
    REQUIRE(link.a->isRunning());
    REQUIRE(link.b->isRunning());
}

TEST_CASE("PeerProtocol raises SyncTimeout once when configured", "[protocol][peer]")
{
    auto params = paramsFor(1, kAddrB, 1);
    params.sync.syncTimeoutMs = 1000;
    Link link{params};
    link.network.setPartitioned(kAddrA, kAddrB, true);
    link.a->synchronize();

    link.clock.advance(1001);
    link.pump();
    link.clock.advance(1000);
    link.pump();
    REQUIRE(Link::count<event::SyncTimeout>(link.eventsA) == 1);
    REQUIRE(link.a->state() == PeerState::Synchronizing);
}

TEST_CASE("PeerProtocol delivers every input exactly once", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.a->sendInput(core::Frame{0}, input(0x11), link.statuses);
    link.pump();
    // Frame 1 goes out before the ack for frame 0 reaches A.
    link.a->sendInput(core::Frame{1}, input(0x22), link.statuses);
    link.a->sendInput(core::Frame{2}, input(0x22), link.statuses);
    link.pump();
    link.pump();

    const auto received = Link::inputs(link.eventsB);
    REQUIRE(received.size() == 3);
    for (core::usize i = 0; i < received.size(); ++i)
        REQUIRE(received[i].frame == core::Frame{static_cast<core::i32>(i)});
    REQUIRE(received[0].bytes[0] == core::byte{0x11});
    REQUIRE(received[2].bytes[0] == core::byte{0x22});
    REQUIRE(link.b->lastReceivedFrame() == core::Frame{2});
    REQUIRE(link.a->pendingOutputSize() == 0);
}

TEST_CASE("PeerProtocol ignores duplicated datagrams", "[protocol][peer]")
{
    Link link;
    link.synchronize();
    link.network.setConditions(transport::LinkConditions{0, 0, 0.0, 1.0});

    for (core::i32 f = 0; f < 5; ++f)
    {
        link.a->sendInput(core::Frame{f}, input(static_cast<core::u8>(f)), link.statuses);
        link.pump();
    }

    const auto received = Link::inputs(link.eventsB);
    REQUIRE(received.size() == 5);
    REQUIRE(received.back().bytes[0] == core::byte{4});
}

TEST_CASE("PeerProtocol recovers lost input through retransmission", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.network.setPartitioned(kAddrA, kAddrB, true);
    link.a->sendInput(core::Frame{0}, input(1), link.statuses);
    link.a->sendInput(core::Frame{1}, input(2), link.statuses);
    link.pump();
    REQUIRE(Link::inputs(link.eventsB).empty());

    link.network.setPartitioned(kAddrA, kAddrB, false);
    link.clock.advance(core::kRunningRetryIntervalMs + 1);
    link.pump();
    link.pump();
    link.pump();

    const auto received = Link::inputs(link.eventsB);
    REQUIRE(received.size() == 2);
    REQUIRE(received[1].bytes[0] == core::byte{2});
    REQUIRE(link.a->pendingOutputSize() == 0);
}

TEST_CASE("PeerProtocol splits a backlog larger than one datagram", "[protocol][peer]")
{
    constexpr core::i32 kBacklog = 64;
    auto paramsA = paramsFor(1, kAddrB, 1);
    auto paramsB = paramsFor(0, kAddrA, 2);
    for (auto *params : {&paramsA, &paramsB})
    {
        params->inputSize = core::kMaxInputBytes;
        params->maxPrediction = kBacklog;
    }
    Link link{paramsA, paramsB};
    link.synchronize();

    auto noise = [](core::i32 frame) {
        std::array<core::byte, core::kMaxInputBytes> bytes{};
        for (core::usize k = 0; k < bytes.size(); ++k)
            bytes[k] = static_cast<core::byte>(((static_cast<core::u32>(frame) * 131u + k * 29u) * 2654435761u) >> 24);
        return bytes;
    };

    link.network.setPartitioned(kAddrA, kAddrB, true);
    for (core::i32 f = 0; f < kBacklog; ++f)
        link.a->sendInput(core::Frame{f}, noise(f), link.statuses);
    link.pump();
    REQUIRE(link.a->pendingOutputSize() == static_cast<core::usize>(kBacklog));

    link.network.setPartitioned(kAddrA, kAddrB, false);
    for (int i = 0; i < 10 && link.a->pendingOutputSize() > 0; ++i)
    {
        link.clock.advance(core::kRunningRetryIntervalMs + 1);
        link.pump();
        link.pump();
    }

    const auto received = Link::inputs(link.eventsB);
    REQUIRE(received.size() == static_cast<core::usize>(kBacklog));
    for (core::i32 f = 0; f < kBacklog; ++f)
    {
        REQUIRE(received[f].frame == core::Frame{f});
        REQUIRE(std::ranges::equal(received[f].bytes, noise(f)));
    }
    CHECK(link.a->pendingOutputSize() == 0);
}

TEST_CASE("PeerProtocol merges remote connection status monotonically", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.statuses[0] = netcode::ConnectionStatus{false, core::Frame{4}};
    link.statuses[1] = netcode::ConnectionStatus{true, core::Frame{2}};
    link.a->sendInput(core::Frame{0}, input(1), link.statuses);
    link.pump();

    // An older report must not undo what B already learned.
    link.statuses[0] = netcode::ConnectionStatus{false, core::Frame{1}};
    link.statuses[1] = netcode::ConnectionStatus{false, core::Frame{1}};
    link.a->sendInput(core::Frame{1}, input(1), link.statuses);
    link.pump();

    REQUIRE(link.b->peerConnectStatus(core::PlayerHandle{0}).lastFrame == core::Frame{4});
    REQUIRE(link.b->peerConnectStatus(core::PlayerHandle{1}).disconnected);
}

TEST_CASE("PeerProtocol drops messages from another session", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    InputMessage forged;
    forged.startFrame = core::Frame{0};
    forged.ackFrame = core::Frame::null();
    forged.peerConnectStatus.resize(2);
    forged.bytes = {core::byte{0x03}, core::byte{0x7F}};
    link.b->handleMessage(Message{MessageHeader{static_cast<core::u16>(link.a->magic() ^ 0x5A5A), 1}, forged});

    REQUIRE(Link::inputs(link.b->poll(link.statuses)).empty());
}

TEST_CASE("PeerProtocol reports silence, resumption and timeout", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.clock.advance(core::kDisconnectNotifyStartMs + 1);
    link.eventsA = link.a->poll(link.statuses);
    REQUIRE(Link::count<event::NetworkInterrupted>(link.eventsA) == 1);
    const auto interrupted = std::get<event::NetworkInterrupted>(link.eventsA.front());
    REQUIRE(interrupted.disconnectTimeoutMs == core::kDisconnectTimeoutMs - core::kDisconnectNotifyStartMs);

    link.eventsA.clear();
    link.pump();
    link.pump();
    REQUIRE(Link::count<event::NetworkResumed>(link.eventsA) == 1);

    link.clock.advance(core::kDisconnectTimeoutMs + 1);
    auto events = link.a->poll(link.statuses);
    REQUIRE(Link::count<event::Disconnected>(events) == 1);
    REQUIRE(Link::count<event::Disconnected>(link.a->poll(link.statuses)) == 0);
}

TEST_CASE("PeerProtocol gives up on a peer that never acknowledges", "[protocol][peer]")
{
    auto params = paramsFor(1, kAddrB, 1);
    params.protocol.pendingOutputLimit = 4;
    Link link{params};
    link.synchronize();

    link.network.setPartitioned(kAddrA, kAddrB, true);
    for (core::i32 f = 0; f < 5; ++f)
        link.a->sendInput(core::Frame{f}, input(1), link.statuses);

    REQUIRE(Link::count<event::Disconnected>(link.a->poll(link.statuses)) == 1);
}

TEST_CASE("PeerProtocol disconnect notifies the remote and shuts down", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.a->disconnect();
    REQUIRE(link.a->state() == PeerState::Disconnected);
    link.pump();
    REQUIRE(Link::count<event::Disconnected>(link.eventsB) == 1);

    link.clock.advance(core::kShutdownDelayMs + 1);
    link.pump();
    REQUIRE(link.a->state() == PeerState::Shutdown);
    REQUIRE_FALSE(link.a->networkStats().has_value());
}

TEST_CASE("PeerProtocol measures round trip time", "[protocol][peer]")
{
    Link link;
    REQUIRE(link.a->networkStats().error().code() == core::ErrorCode::kNotSynchronized);
    link.synchronize();

    link.clock.advance(core::kQualityReportIntervalMs + 1);
    (void)link.a->poll(link.statuses);
    REQUIRE(link.a->flush(link.transportA).has_value());
    Link::receiveAll(*link.b, link.transportB);
    REQUIRE(link.b->flush(link.transportB).has_value());

    link.clock.advance(40);
    Link::receiveAll(*link.a, link.transportA);

    const auto stats = link.a->networkStats();
    REQUIRE(stats.has_value());
    REQUIRE(stats->pingMs == 40);
    REQUIRE(stats->recommendedInputDelay == 2);
}

TEST_CASE("PeerProtocol keeps remote checksums for comparison", "[protocol][peer]")
{
    Link link;
    link.synchronize();

    link.a->sendChecksumReport(core::Frame{10}, 0xAAAA);
    link.a->sendChecksumReport(core::Frame{20}, 0xBBBB);
    link.pump();

    const auto &pending = link.b->pendingChecksums();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending.at(core::Frame{20}) == 0xBBBB);
}

} // namespace rwn::net::protocol
