/**
 * @file Message.cpp
 * @brief Wire codec for peer-to-peer messages.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/protocol/Message.hpp>
#include <rwn/net/protocol/Bitstream.hpp>

#include <format>
#include <type_traits>

namespace rwn::net::protocol {

namespace {

// An input payload never outgrows the datagram carrying it.
constexpr core::usize kMaxInputPayload = core::kMaxDatagramSize;

template <class>
inline constexpr bool kAlwaysFalse = false;

void encodeBody(Bitstream &out, const MessageBody &body)
{
    std::visit([&out](const auto &msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, SyncRequest>)
        {
            out.writeU32(msg.randomRequest);
        }
        else if constexpr (std::is_same_v<T, SyncReply>)
        {
            out.writeU32(msg.randomReply);
        }
        else if constexpr (std::is_same_v<T, InputMessage>)
        {
            out.writeU8(static_cast<core::u8>(msg.peerConnectStatus.size()));
            for (const auto &status : msg.peerConnectStatus)
            {
                out.writeBool(status.disconnected);
                out.writeFrame(status.lastFrame);
            }
            out.writeBool(msg.disconnectRequested);
            out.writeFrame(msg.startFrame);
            out.writeFrame(msg.ackFrame);
            out.writeVarint(msg.bytes.size());
            out.writeBytes(msg.bytes);
        }
        else if constexpr (std::is_same_v<T, InputAck>)
        {
            out.writeFrame(msg.ackFrame);
        }
        else if constexpr (std::is_same_v<T, QualityReport>)
        {
            out.writeI16(msg.frameAdvantage);
            out.writeU64(msg.pingMs);
        }
        else if constexpr (std::is_same_v<T, QualityReply>)
        {
            out.writeU64(msg.pongMs);
        }
        else if constexpr (std::is_same_v<T, ChecksumReport>)
        {
            out.writeFrame(msg.frame);
            out.writeU64(msg.checksum);
        }
        else if constexpr (std::is_same_v<T, KeepAlive>)
        {
        }
        else
        {
            static_assert(kAlwaysFalse<T>, "unhandled message body");
        }
    }, body);
}

core::Expected<InputMessage> decodeInput(Bitstream &in)
{
    InputMessage msg;

    const core::u8 statusCount = RWN_TRY(in.readU8());
    if (statusCount > core::kMaxPlayers)
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("{} connection records exceed {} players", statusCount, core::kMaxPlayers));
    }

    msg.peerConnectStatus.resize(statusCount);
    for (auto &status : msg.peerConnectStatus)
    {
        status.disconnected = RWN_TRY(in.readBool());
        status.lastFrame    = RWN_TRY(in.readFrame());
    }

    msg.disconnectRequested = RWN_TRY(in.readBool());
    msg.startFrame          = RWN_TRY(in.readFrame());
    msg.ackFrame            = RWN_TRY(in.readFrame());

    const core::u64 size = RWN_TRY(in.readVarint());
    if (size > kMaxInputPayload)
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("input payload of {} bytes exceeds {}", size, kMaxInputPayload));
    }
    msg.bytes = RWN_TRY(in.readBytes(static_cast<core::u32>(size)));
    return msg;
}

core::Expected<MessageBody> decodeBody(Bitstream &in, core::u8 type)
{
    switch (static_cast<MessageType>(type))
    {
    case MessageType::SyncRequest:
        return SyncRequest{RWN_TRY(in.readU32())};
    case MessageType::SyncReply:
        return SyncReply{RWN_TRY(in.readU32())};
    case MessageType::Input:
        return RWN_TRY(decodeInput(in));
    case MessageType::InputAck:
        return InputAck{RWN_TRY(in.readFrame())};
    case MessageType::QualityReport:
    {
        QualityReport report;
        report.frameAdvantage = RWN_TRY(in.readI16());
        report.pingMs         = RWN_TRY(in.readU64());
        return report;
    }
    case MessageType::QualityReply:
        return QualityReply{RWN_TRY(in.readU64())};
    case MessageType::ChecksumReport:
    {
        ChecksumReport report;
        report.frame    = RWN_TRY(in.readFrame());
        report.checksum = RWN_TRY(in.readU64());
        return report;
    }
    case MessageType::KeepAlive:
        return KeepAlive{};
    }
    return core::makeError(core::ErrorCode::kMalformedMessage, std::format("unknown message type {}", type));
}

} // namespace

MessageType messageType(const MessageBody &body) noexcept
{
    return static_cast<MessageType>(body.index() + 1);
}

core::Expected<std::vector<core::byte>> encodeMessage(const Message &message)
{
    if (const auto *input = std::get_if<InputMessage>(&message.body))
    {
        if (input->peerConnectStatus.size() > core::kMaxPlayers || input->bytes.size() > kMaxInputPayload)
        {
            return core::makeError(core::ErrorCode::kInvalidRequest,
                                   std::format("input message too large ({} records, {} bytes)",
                                               input->peerConnectStatus.size(), input->bytes.size()));
        }
    }

    Bitstream out;
    out.writeU16(message.header.magic);
    out.writeU8(message.header.version);
    out.writeU8(static_cast<core::u8>(messageType(message.body)));
    encodeBody(out, message.body);
    auto datagram = out.release();
    if (datagram.size() > core::kMaxDatagramSize)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("message of {} bytes exceeds the {} byte datagram limit", datagram.size(),
                                           core::kMaxDatagramSize));
    }
    return datagram;
}

core::Expected<Message> decodeMessage(std::span<const core::byte> datagram)
{
    Bitstream in{datagram};

    Message message;
    message.header.magic   = RWN_TRY(in.readU16());
    message.header.version = RWN_TRY(in.readU8());
    if (message.header.version != core::kProtocolVersion)
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("protocol version {} (expected {})",
                                           message.header.version, core::kProtocolVersion));
    }

    const core::u8 type = RWN_TRY(in.readU8());
    message.body = RWN_TRY(decodeBody(in, type));

    if (in.bitsRemaining() >= 8)
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("{} trailing bits after message body", in.bitsRemaining()));
    }
    return message;
}

} // namespace rwn::net::protocol
