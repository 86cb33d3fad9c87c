/**
 * @file main.cpp
 * @brief RewindNet determinism check: runs the demo game through a
 *        SyncTestSession and reports the first diverging frames.
 *
 * Usage: rwn_synctest [frames] [checkDistance] [log level]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include "../common/DemoGame.hpp"

#include <rwn/net/session/SyncTestSession.hpp>
#include <rwn/core/Log.hpp>
#include <rwn/core/Types.hpp>

#include <charconv>
#include <format>
#include <string_view>

using namespace rwn;

namespace {

constexpr core::u32 kPlayers = 2;

core::u32 argOr(int argc, char *argv[], int index, core::u32 fallback)
{
    if (argc <= index)
        return fallback;
    const std::string_view text{argv[index]};
    core::u32 value = fallback;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        core::Log::warn("SyncTest", std::format("ignoring argument '{}'", text));
        return fallback;
    }
    return value;
}

} // namespace

int main(int argc, char *argv[])
{
    const core::u32 frames        = argOr(argc, argv, 1, 600);
    const core::u32 checkDistance = argOr(argc, argv, 2, core::kDefaultCheckDistance);
    if (argc > 3 && !core::Log::setMinLevel(argv[3]))
        core::Log::warn("SyncTest", std::format("unknown log level '{}'", argv[3]));

    core::Log::info("SyncTest", "=== RewindNet SyncTest ===");

    auto config = net::session::SessionConfig::Builder{}
        .numPlayers(kPlayers)
        .inputSize(1)
        .maxPrediction(core::kDefaultMaxPrediction)
        .checkDistance(checkDistance)
        .build();
    if (!config)
    {
        core::Log::error("SyncTest", config.error().describe());
        return 1;
    }

    apps::DemoGame game{kPlayers};
    auto session = net::session::SyncTestSession::create(*config, game.callbacks());
    if (!session)
    {
        core::Log::error("SyncTest", session.error().describe());
        return 1;
    }

    while (static_cast<core::u32>((*session)->currentFrame().value()) < frames)
    {
        const core::Frame frame = (*session)->currentFrame();
        for (core::u32 p = 0; p < kPlayers; ++p)
        {
            const core::u8 input = apps::DemoGame::botInput(p, frame);
            if (auto added = (*session)->addLocalInput(core::PlayerHandle{p}, frame, input); !added)
            {
                core::Log::error("SyncTest", added.error().describe());
                return 1;
            }
        }

        if (auto advanced = (*session)->simulateFrame(); !advanced)
        {
            core::Log::error("SyncTest", std::format("frame {}: {}", frame.value(), advanced.error().describe()));
            return 2;
        }
    }

    core::Log::info("SyncTest", std::format("{} frames replayed consistently, final state {:#018x}",
                                            frames, game.checksum()));
    return 0;
}
