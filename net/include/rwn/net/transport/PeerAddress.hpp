// /////////////////////////////////////////////////////////////////////////////
/// @file PeerAddress.hpp
/// @brief IPv4 endpoint identifying a remote peer.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Expected.hpp>
#include <rwn/core/Types.hpp>

#include <compare>
#include <string>
#include <string_view>

namespace rwn::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @struct PeerAddress
/// @brief Host-order IPv4 address and UDP port.
///
/// Also used as an opaque key by in-memory transports, which only need the
/// value to be unique and totally ordered.
// /////////////////////////////////////////////////////////////////////////////
struct PeerAddress
{
    core::u32 host{0};
    core::u16 port{0};

    [[nodiscard]] static constexpr PeerAddress ipv4(core::u8 a, core::u8 b, core::u8 c, core::u8 d,
                                                    core::u16 port) noexcept
    {
        return PeerAddress{(static_cast<core::u32>(a) << 24) | (static_cast<core::u32>(b) << 16) |
                               (static_cast<core::u32>(c) << 8) | static_cast<core::u32>(d),
                           port};
    }

    /// @brief Parses "a.b.c.d:port".
    /// @return kInvalidConfig when @p text is not a dotted quad with a port.
    [[nodiscard]] static core::Expected<PeerAddress> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    constexpr auto operator<=>(const PeerAddress &) const noexcept = default;
};

} // namespace rwn::net::transport
