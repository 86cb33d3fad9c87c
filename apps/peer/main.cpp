/**
 * @file main.cpp
 * @brief RewindNet peer: plays the demo game against remote peers over UDP.
 *
 * Usage:
 *   rwn_peer --port 7000 --local 0 --remote 1=127.0.0.1:7001
 *            [--players 2] [--frames 1200] [--delay 2] [--desync 10]
 *            [--log debug]
 *
 * Every local player is driven by DemoGame::botInput, so two processes
 * started with mirrored arguments print the same final checksum.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include "../common/DemoGame.hpp"

#include <rwn/net/session/P2PSession.hpp>
#include <rwn/net/transport/ThreadedTransport.hpp>
#include <rwn/net/transport/UdpTransport.hpp>
#include <rwn/core/Clock.hpp>
#include <rwn/core/Log.hpp>
#include <rwn/core/Types.hpp>

#include <charconv>
#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

using namespace rwn;

namespace {

constexpr std::string_view kTag = "Peer";

struct Options
{
    core::u16 port{7000};
    core::u32 players{2};
    core::u32 frames{1200};
    core::u32 delay{2};
    core::u32 desyncInterval{0};
    std::vector<core::u32> local;
    std::vector<std::pair<core::u32, net::transport::PeerAddress>> remote;
};

template <typename T>
core::Expected<T> parseNumber(std::string_view text)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return core::makeError(core::ErrorCode::kInvalidConfig, std::format("'{}' is not a number", text));
    return value;
}

core::Expected<Options> parseOptions(int argc, char *argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view flag{argv[i]};
        if (i + 1 >= argc)
            return core::makeError(core::ErrorCode::kInvalidConfig, std::format("{} needs a value", flag));
        const std::string_view value{argv[++i]};

        if (flag == "--port")
            options.port = RWN_TRY(parseNumber<core::u16>(value));
        else if (flag == "--players")
            options.players = RWN_TRY(parseNumber<core::u32>(value));
        else if (flag == "--frames")
            options.frames = RWN_TRY(parseNumber<core::u32>(value));
        else if (flag == "--delay")
            options.delay = RWN_TRY(parseNumber<core::u32>(value));
        else if (flag == "--desync")
            options.desyncInterval = RWN_TRY(parseNumber<core::u32>(value));
        else if (flag == "--local")
            options.local.push_back(RWN_TRY(parseNumber<core::u32>(value)));
        else if (flag == "--remote")
        {
            const auto eq = value.find('=');
            if (eq == std::string_view::npos)
                return core::makeError(core::ErrorCode::kInvalidConfig,
                                       std::format("--remote expects handle=a.b.c.d:port, got '{}'", value));
            const auto handle = RWN_TRY(parseNumber<core::u32>(value.substr(0, eq)));
            const auto address = RWN_TRY(net::transport::PeerAddress::parse(value.substr(eq + 1)));
            options.remote.emplace_back(handle, address);
        }
        else if (flag == "--log")
        {
            if (!core::Log::setMinLevel(value))
                return core::makeError(core::ErrorCode::kInvalidConfig, std::format("unknown log level '{}'", value));
        }
        else
            return core::makeError(core::ErrorCode::kInvalidConfig, std::format("unknown option {}", flag));
    }
    if (options.local.empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "at least one --local player is required");
    return options;
}

std::string describe(const net::session::SessionEvent &event)
{
    namespace ev = net::session::event;
    return std::visit(
        [](const auto &e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ev::Synchronizing>)
                return std::format("synchronizing with {} ({}/{})", e.address.toString(), e.count, e.total);
            else if constexpr (std::is_same_v<T, ev::Synchronized>)
                return std::format("synchronized with {}", e.address.toString());
            else if constexpr (std::is_same_v<T, ev::Running>)
                return "running";
            else if constexpr (std::is_same_v<T, ev::Disconnected>)
                return std::format("{} disconnected", e.address.toString());
            else if constexpr (std::is_same_v<T, ev::NetworkInterrupted>)
                return std::format("{} silent, dropping in {} ms", e.address.toString(), e.disconnectTimeoutMs);
            else if constexpr (std::is_same_v<T, ev::NetworkResumed>)
                return std::format("{} is back", e.address.toString());
            else if constexpr (std::is_same_v<T, ev::SyncTimeout>)
                return std::format("no handshake from {} after {} ms", e.address.toString(), e.elapsedMs);
            else if constexpr (std::is_same_v<T, ev::WaitRecommendation>)
                return std::format("ahead of peers, waiting {} frames", e.skipFrames);
            else
                return std::format("desync at frame {} with {} ({:#018x} vs {:#018x})", e.frame.value(),
                                   e.address.toString(), e.localChecksum, e.remoteChecksum);
        },
        event);
}

} // namespace

int main(int argc, char *argv[])
{
    const auto options = parseOptions(argc, argv);
    if (!options)
    {
        core::Log::error(kTag, options.error().describe());
        return 1;
    }

    core::Log::info(kTag, "=== RewindNet Peer ===");

    net::session::SessionConfig::Builder builder;
    builder.numPlayers(options->players)
        .inputSize(1)
        .inputDelay(options->delay)
        .rngSeed(options->port)
        .desyncDetection(options->desyncInterval > 0 ? net::protocol::DesyncDetection::on(options->desyncInterval)
                                                     : net::protocol::DesyncDetection::off());
    for (const auto handle : options->local)
        builder.addLocalPlayer(core::PlayerHandle{handle});
    for (const auto &[handle, address] : options->remote)
        builder.addRemotePlayer(core::PlayerHandle{handle}, address);

    const auto config = builder.build();
    if (!config)
    {
        core::Log::error(kTag, config.error().describe());
        return 1;
    }

    core::SteadyClock clock;
    net::transport::UdpTransport udp{options->port};
    net::transport::ThreadedTransport transport{udp};
    apps::DemoGame game{options->players};

    auto session = net::session::P2PSession::create(*config, transport, clock, game.callbacks());
    if (!session)
    {
        core::Log::error(kTag, session.error().describe());
        return 1;
    }
    auto &p2p = **session;

    const core::u64 frameMs = 1000 / config->fps();
    core::u64 nextTickMs = clock.nowMs();

    while (static_cast<core::u32>(p2p.currentFrame().value()) < options->frames)
    {
        for (const auto &event : p2p.drainEvents())
        {
            core::Log::info(kTag, describe(event));
            if (const auto *wait = std::get_if<net::session::event::WaitRecommendation>(&event))
                nextTickMs += wait->skipFrames * frameMs;
        }

        if (clock.nowMs() < nextTickMs)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
            continue;
        }
        nextTickMs += frameMs;

        if (p2p.state() != net::session::SessionState::Running)
        {
            if (auto polled = p2p.poll(); !polled)
            {
                core::Log::error(kTag, polled.error().describe());
                return 2;
            }
            continue;
        }

        const core::Frame frame = p2p.currentFrame();
        bool stalled = false;
        for (const auto handle : options->local)
        {
            const core::u8 input = apps::DemoGame::botInput(handle, frame);
            auto added = p2p.addLocalInput(core::PlayerHandle{handle}, frame, input);
            if (!added && added.error().code() == core::ErrorCode::kPredictionThreshold)
            {
                stalled = true;
                break;
            }
            if (!added)
            {
                core::Log::error(kTag, added.error().describe());
                return 2;
            }
        }

        auto progressed = stalled ? p2p.poll() : p2p.simulateFrame().transform([](core::Frame) {});
        if (!progressed)
        {
            core::Log::error(kTag, progressed.error().describe());
            return 2;
        }

        if (!stalled && frame.value() % 300 == 0)
        {
            for (const auto &[handle, address] : options->remote)
            {
                if (const auto stats = p2p.networkStats(core::PlayerHandle{handle}); stats)
                {
                    core::Log::info(kTag, std::format("frame {} | {} ping {} ms, {} KB/s, behind {} | suggested delay {}",
                                                      frame.value(), address.toString(), stats->pingMs,
                                                      stats->kbpsSent, stats->localFramesBehind,
                                                      stats->recommendedInputDelay));
                }
            }
        }
    }

    core::Log::info(kTag, std::format("reached frame {} (confirmed {}), state {:#018x}", p2p.currentFrame().value(),
                                      p2p.confirmedFrame().value(), game.checksum()));
    transport.close();
    return 0;
}
