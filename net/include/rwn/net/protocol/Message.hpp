// /////////////////////////////////////////////////////////////////////////////
/// @file Message.hpp
/// @brief Peer-to-peer wire messages and their codec.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/ConnectionStatus.hpp>
#include <rwn/core/Constants.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/Types.hpp>

#include <span>
#include <variant>
#include <vector>

namespace rwn::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @enum MessageType
/// @brief Wire discriminant of a message body.
// /////////////////////////////////////////////////////////////////////////////
enum class MessageType : core::u8
{
    SyncRequest    = 1,
    SyncReply      = 2,
    Input          = 3,
    InputAck       = 4,
    QualityReport  = 5,
    QualityReply   = 6,
    ChecksumReport = 7,
    KeepAlive      = 8
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct MessageHeader
/// @brief Prefix of every datagram.
///
/// @c magic identifies the sending endpoint for the lifetime of a session;
/// once learned during the handshake, datagrams with another magic are
/// treated as belonging to a different session and dropped.
// /////////////////////////////////////////////////////////////////////////////
struct MessageHeader
{
    core::u16 magic{0};
    core::u8  version{core::kProtocolVersion};
};

struct SyncRequest
{
    core::u32 randomRequest{0};
};

struct SyncReply
{
    core::u32 randomReply{0};
};

/// @brief Every unacknowledged input frame from @c startFrame onward,
///        compressed against the last frame the receiver acknowledged.
struct InputMessage
{
    std::vector<netcode::ConnectionStatus> peerConnectStatus;
    bool                                   disconnectRequested{false};
    core::Frame                            startFrame{};
    core::Frame                            ackFrame{};
    std::vector<core::byte>                bytes;
};

struct InputAck
{
    core::Frame ackFrame{};
};

struct QualityReport
{
    core::i16 frameAdvantage{0};
    core::u64 pingMs{0};
};

struct QualityReply
{
    core::u64 pongMs{0};
};

struct ChecksumReport
{
    core::Frame frame{};
    core::u64   checksum{0};
};

struct KeepAlive
{};

using MessageBody = std::variant<SyncRequest,
                                 SyncReply,
                                 InputMessage,
                                 InputAck,
                                 QualityReport,
                                 QualityReply,
                                 ChecksumReport,
                                 KeepAlive>;

struct Message
{
    MessageHeader header;
    MessageBody   body;
};

/// @brief Wire discriminant of @p body.
[[nodiscard]] MessageType messageType(const MessageBody &body) noexcept;

/// @brief Serializes @p message.
/// @return kInvalidRequest when a field exceeds its wire limits or the
///         result would not fit in one datagram.
[[nodiscard]] core::Expected<std::vector<core::byte>> encodeMessage(const Message &message);

/// @brief Parses a received datagram.
/// @return kMalformedMessage for unknown types, a foreign protocol version,
///         truncation, trailing bytes or out-of-range counts.
[[nodiscard]] core::Expected<Message> decodeMessage(std::span<const core::byte> datagram);

} // namespace rwn::net::protocol
