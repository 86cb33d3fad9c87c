// /////////////////////////////////////////////////////////////////////////////
/// @file PeerProtocol.hpp
/// @brief Per-remote-endpoint handshake, input exchange and link monitoring.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/ConnectionStatus.hpp>
#include <rwn/net/netcode/TimeSync.hpp>
#include <rwn/net/protocol/Message.hpp>
#include <rwn/net/protocol/ProtocolConfig.hpp>
#include <rwn/net/transport/ITransport.hpp>
#include <rwn/core/Clock.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <deque>
#include <map>
#include <random>
#include <span>
#include <variant>
#include <vector>

namespace rwn::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @enum PeerState
/// @brief Lifecycle of one remote endpoint.
// /////////////////////////////////////////////////////////////////////////////
enum class PeerState : core::u8
{
    Initializing,
    Synchronizing,
    Running,
    Disconnected,
    Shutdown
};

/// @brief Events raised by a PeerProtocol, drained by its session.
namespace event {

struct Synchronizing
{
    core::u32 total{0};
    core::u32 count{0};
};

struct Synchronized
{};

/// @brief Inputs of every player behind the endpoint for one frame,
///        concatenated in handle order.
struct Input
{
    core::Frame             frame{};
    std::vector<core::byte> bytes;
};

struct Disconnected
{};

struct NetworkInterrupted
{
    core::u64 disconnectTimeoutMs{0};
};

struct NetworkResumed
{};

struct SyncTimeout
{
    core::u64 elapsedMs{0};
};

} // namespace event

using PeerEvent = std::variant<event::Synchronizing,
                               event::Synchronized,
                               event::Input,
                               event::Disconnected,
                               event::NetworkInterrupted,
                               event::NetworkResumed,
                               event::SyncTimeout>;

// /////////////////////////////////////////////////////////////////////////////
/// @struct NetworkStats
/// @brief Link quality towards one remote endpoint.
// /////////////////////////////////////////////////////////////////////////////
struct NetworkStats
{
    core::u32 sendQueueLength{0};
    core::u64 pingMs{0};
    /// Kilobytes per second, UDP headers included.
    core::u32 kbpsSent{0};
    core::i32 localFramesBehind{0};
    core::i32 remoteFramesBehind{0};
    /// Frames of input delay that would hide half the round trip.
    core::u32 recommendedInputDelay{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PeerProtocolParams
/// @brief Construction parameters of a PeerProtocol.
// /////////////////////////////////////////////////////////////////////////////
struct PeerProtocolParams
{
    /// Players simulated by the remote endpoint.
    std::vector<core::PlayerHandle> handles;
    transport::PeerAddress          address;
    core::u32                       numPlayers{0};
    core::u32                       localPlayers{0};
    core::u32                       inputSize{0};
    core::u32                       maxPrediction{core::kDefaultMaxPrediction};
    core::u32                       fps{core::kDefaultFps};
    core::u64                       disconnectTimeoutMs{core::kDisconnectTimeoutMs};
    core::u64                       disconnectNotifyStartMs{core::kDisconnectNotifyStartMs};
    SyncConfig                      sync;
    ProtocolConfig                  protocol;
    DesyncDetection                 desync;
    core::u64                       seed{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PeerProtocol
/// @brief Reliable input delivery to one remote endpoint over datagrams.
///
/// Outgoing inputs stay queued until acknowledged and are resent as one
/// delta-compressed batch on every send. Timers are evaluated against the
/// injected clock in @ref poll; outgoing messages accumulate until
/// @ref flush hands them to a transport.
// /////////////////////////////////////////////////////////////////////////////
class PeerProtocol final : public core::NonCopyable<PeerProtocol>
{
public:
    PeerProtocol(PeerProtocolParams params, const core::IClock &clock);

    /// @brief Starts the handshake.
    void synchronize();

    /// @brief Stops exchanging input; the endpoint shuts down after the
    ///        configured delay.
    void disconnect();

    /// @brief Runs retransmission and timeout timers, then returns every
    ///        event raised since the last call.
    [[nodiscard]] std::vector<PeerEvent> poll(std::span<const netcode::ConnectionStatus> localStatus);

    /// @brief Queues the combined local inputs of @p frame. Ignored unless running.
    void sendInput(core::Frame frame,
                   std::span<const core::byte> bytes,
                   std::span<const netcode::ConnectionStatus> localStatus);

    void sendChecksumReport(core::Frame frame, core::u64 checksum);

    /// @brief Processes a decoded message received from this endpoint.
    void handleMessage(const Message &message);

    /// @brief Re-estimates how far the remote simulation is ahead of @p localFrame.
    void updateLocalFrameAdvantage(core::Frame localFrame);

    /// @brief Sends every queued message.
    /// @return The first transport error; remaining messages are still attempted.
    [[nodiscard]] core::Expected<void> flush(transport::ITransport &transport);

    /// @return kNotSynchronized before the handshake started or after shutdown.
    [[nodiscard]] core::Expected<NetworkStats> networkStats() const;

    [[nodiscard]] PeerState state() const noexcept { return state_; }
    [[nodiscard]] bool isSynchronized() const noexcept
    {
        return state_ == PeerState::Running || state_ == PeerState::Disconnected || state_ == PeerState::Shutdown;
    }
    [[nodiscard]] bool isRunning() const noexcept { return state_ == PeerState::Running; }
    [[nodiscard]] bool isHandlingMessage(const transport::PeerAddress &from) const noexcept { return from == params_.address; }

    [[nodiscard]] const std::vector<core::PlayerHandle> &handles() const noexcept { return params_.handles; }
    [[nodiscard]] const transport::PeerAddress &address() const noexcept { return params_.address; }
    [[nodiscard]] core::u16 magic() const noexcept { return magic_; }

    /// @brief What the remote endpoint last reported about @p handle.
    [[nodiscard]] netcode::ConnectionStatus peerConnectStatus(core::PlayerHandle handle) const;

    [[nodiscard]] core::i32 averageFrameAdvantage() const noexcept { return timeSync_.averageFrameAdvantage(); }

    /// @brief Checksums reported by the remote endpoint, not yet compared.
    [[nodiscard]] std::map<core::Frame, core::u64> &pendingChecksums() noexcept { return pendingChecksums_; }

    [[nodiscard]] core::usize pendingOutputSize() const noexcept { return pendingOutput_.size(); }
    [[nodiscard]] core::Frame lastReceivedFrame() const noexcept;

private:
    struct PendingInput
    {
        core::Frame             frame{};
        std::vector<core::byte> bytes;
    };

    void queueMessage(MessageBody body);
    void sendSyncRequest();
    void sendPendingOutput(std::span<const netcode::ConnectionStatus> localStatus);
    void sendQualityReport();
    void popPendingOutput(core::Frame ackFrame);

    void onSyncRequest(const MessageHeader &header, const SyncRequest &body);
    void onSyncReply(const MessageHeader &header, const SyncReply &body);
    void onInput(const InputMessage &body);
    void onQualityReport(const QualityReport &body);
    void onQualityReply(const QualityReply &body);
    void onChecksumReport(const ChecksumReport &body);

    [[nodiscard]] const std::vector<core::byte> *decodeReference(core::Frame startFrame) const;

    PeerProtocolParams   params_;
    const core::IClock  &clock_;
    std::mt19937         rng_;
    core::u16            magic_{0};
    core::u16            remoteMagic_{0};
    PeerState            state_{PeerState::Initializing};

    std::deque<core::u32> syncRandomRequests_;
    core::u32            syncRemainingRoundtrips_{0};
    bool                 syncTimeoutSent_{false};

    std::deque<Message>     sendQueue_;
    std::deque<PendingInput> pendingOutput_;
    PendingInput            lastAckedInput_;
    std::map<core::Frame, std::vector<core::byte>> recvInputs_;
    std::vector<netcode::ConnectionStatus> peerConnectStatus_;
    std::vector<netcode::ConnectionStatus> lastLocalStatus_;

    std::vector<PeerEvent> events_;
    netcode::TimeSync      timeSync_;
    core::i32              localFrameAdvantage_{0};
    core::i32              remoteFrameAdvantage_{0};
    core::f64              roundTripMs_{0.0};

    std::map<core::Frame, core::u64> pendingChecksums_;

    core::u64 statsStartMs_{0};
    core::u64 lastSendMs_{0};
    core::u64 lastRecvMs_{0};
    core::u64 lastInputRecvMs_{0};
    core::u64 lastQualityReportMs_{0};
    core::u64 shutdownAtMs_{0};
    core::u64 bytesSent_{0};
    core::u64 packetsSent_{0};
    bool      disconnectNotifySent_{false};
    bool      disconnectEventSent_{false};
};

} // namespace rwn::net::protocol
