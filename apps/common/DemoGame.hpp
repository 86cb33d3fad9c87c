/**
 * @file DemoGame.hpp
 * @brief Tiny deterministic arena shared by the example executables.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_APPS_DEMOGAME_HPP
    #define RWN_APPS_DEMOGAME_HPP

    #include <rwn/net/session/SessionCallbacks.hpp>
    #include <rwn/math/StateHash.hpp>
    #include <rwn/core/Types.hpp>

    #include <array>
    #include <cstring>
    #include <vector>

namespace rwn::apps {

/** @brief Directions packed in the single input byte. */
enum InputBits : core::u8
{
    kUp    = 1 << 0,
    kDown  = 1 << 1,
    kLeft  = 1 << 2,
    kRight = 1 << 3,
};

/**
 * @brief Players move on a wrapping 256x256 grid; the score counts steps.
 *
 * The whole state is plain integers, so the snapshot is a memcpy and a
 * replay reproduces it bit for bit.
 */
class DemoGame final
{
public:
    struct Player
    {
        core::i32 x{0};
        core::i32 y{0};
        core::u32 score{0};
    };

    explicit DemoGame(core::u32 numPlayers) : players_(numPlayers)
    {
        for (core::u32 i = 0; i < numPlayers; ++i)
            players_[i].x = static_cast<core::i32>(i * 32);
    }

    /// @brief Scripted input of a bot player, a pure function of its arguments.
    [[nodiscard]] static core::u8 botInput(core::u32 handle, core::Frame frame) noexcept
    {
        static constexpr std::array<core::u8, 6> kPattern{kUp, kUp | kRight, kRight, kDown, kDown | kLeft, 0};
        return kPattern[(static_cast<core::u32>(frame.value()) / 20 + handle) % kPattern.size()];
    }

    [[nodiscard]] net::session::SessionCallbacks callbacks()
    {
        net::session::SessionCallbacks callbacks;
        callbacks.saveState = [this](core::Frame) {
            return net::session::SavedStateData{serialize(), std::nullopt};
        };
        callbacks.loadState = [this](core::Frame, std::span<const core::byte> bytes) { deserialize(bytes); };
        callbacks.advanceFrame = [this](std::span<const net::netcode::PlayerFrameInput> inputs, bool) {
            step(inputs);
        };
        return callbacks;
    }

    void step(std::span<const net::netcode::PlayerFrameInput> inputs)
    {
        for (const auto &in : inputs)
        {
            auto &player = players_[in.handle.index()];
            const auto bits = static_cast<core::u8>(in.input.bits[0]);
            const core::i32 dx = ((bits & kRight) ? 1 : 0) - ((bits & kLeft) ? 1 : 0);
            const core::i32 dy = ((bits & kDown) ? 1 : 0) - ((bits & kUp) ? 1 : 0);
            player.x = (player.x + dx) & 0xFF;
            player.y = (player.y + dy) & 0xFF;
            if (dx != 0 || dy != 0)
                ++player.score;
        }
        ++frame_;
    }

    [[nodiscard]] core::i32 frame() const noexcept { return frame_; }
    [[nodiscard]] const std::vector<Player> &players() const noexcept { return players_; }
    [[nodiscard]] core::u64 checksum() const { return math::StateHash::of(serialize()); }

private:
    [[nodiscard]] std::vector<core::byte> serialize() const
    {
        std::vector<core::byte> bytes(sizeof(frame_) + players_.size() * sizeof(Player));
        std::memcpy(bytes.data(), &frame_, sizeof(frame_));
        std::memcpy(bytes.data() + sizeof(frame_), players_.data(), players_.size() * sizeof(Player));
        return bytes;
    }

    void deserialize(std::span<const core::byte> bytes)
    {
        std::memcpy(&frame_, bytes.data(), sizeof(frame_));
        std::memcpy(players_.data(), bytes.data() + sizeof(frame_), players_.size() * sizeof(Player));
    }

    core::i32           frame_{0};
    std::vector<Player> players_;
};

} // namespace rwn::apps

#endif // RWN_APPS_DEMOGAME_HPP
