/**
 * @file PeerAddress.cpp
 * @brief PeerAddress parsing and formatting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/transport/PeerAddress.hpp>

#include <charconv>
#include <format>

namespace rwn::net::transport {

namespace {

bool parseNumber(std::string_view text, core::u32 max, core::u32 &out)
{
    if (text.empty())
        return false;
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end && out <= max;
}

} // namespace

core::Expected<PeerAddress> PeerAddress::parse(std::string_view text)
{
    auto invalid = [text]() {
        return core::makeError(core::ErrorCode::kInvalidConfig,
                               std::format("'{}' is not an address of the form a.b.c.d:port", text));
    };

    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos)
        return invalid();

    core::u32 port = 0;
    if (!parseNumber(text.substr(colon + 1), 0xFFFF, port))
        return invalid();

    std::string_view host = text.substr(0, colon);
    core::u32 value = 0;
    for (int i = 0; i < 4; ++i)
    {
        const auto dot = host.find('.');
        if ((i < 3) == (dot == std::string_view::npos))
            return invalid();
        const auto part = host.substr(0, dot);
        core::u32 octet = 0;
        if (!parseNumber(part, 0xFF, octet))
            return invalid();
        value = (value << 8) | octet;
        host = (dot == std::string_view::npos) ? std::string_view{} : host.substr(dot + 1);
    }

    return PeerAddress{value, static_cast<core::u16>(port)};
}

std::string PeerAddress::toString() const
{
    return std::format("{}.{}.{}.{}:{}", (host >> 24) & 0xFF, (host >> 16) & 0xFF, (host >> 8) & 0xFF,
                       host & 0xFF, port);
}

} // namespace rwn::net::transport
