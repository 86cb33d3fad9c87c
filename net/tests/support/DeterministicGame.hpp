/**
 * @file DeterministicGame.hpp
 * @brief Minimal lockstep-safe game used to drive sessions in tests.
 */

#pragma once

#include "rwn/net/session/SessionCallbacks.hpp"
#include "rwn/math/StateHash.hpp"

#include <cstring>
#include <map>
#include <vector>

namespace rwn::net::test {

/// Each player's first input byte moves them along a line; the accumulator
/// folds every input in so that any divergence shows in the checksum.
class DeterministicGame
{
public:
    explicit DeterministicGame(core::u32 numPlayers) : positions_(numPlayers, 0) {}

    /// State that is advanced but never saved, so a replay diverges.
    bool leakUnsavedState{false};

    core::u32 advances{0};
    core::u32 saves{0};
    core::u32 replayedFrames{0};
    core::u32 loads{0};
    std::vector<netcode::PlayerFrameInput> lastInputs;
    /// Hash of the latest snapshot taken of each frame.
    std::map<core::i32, core::u64> savedHashes;

    [[nodiscard]] session::SessionCallbacks callbacks()
    {
        session::SessionCallbacks callbacks;
        callbacks.saveState = [this](core::Frame frame) {
            ++saves;
            auto bytes = serialize();
            savedHashes[frame.value()] = math::StateHash::of(bytes);
            return session::SavedStateData{std::move(bytes), std::nullopt};
        };
        callbacks.loadState = [this](core::Frame, std::span<const core::byte> bytes) { deserialize(bytes); };
        callbacks.advanceFrame = [this](std::span<const netcode::PlayerFrameInput> inputs, bool replay) {
            advance(inputs, replay);
        };
        return callbacks;
    }

    void advance(std::span<const netcode::PlayerFrameInput> inputs, bool replay)
    {
        ++advances;
        if (replay)
            ++replayedFrames;
        lastInputs.assign(inputs.begin(), inputs.end());

        for (const auto &player : inputs)
        {
            const auto value = static_cast<core::u8>(player.input.bits[0]);
            positions_[player.handle.index()] += static_cast<core::i64>(value) - 1;
            accumulator_ = accumulator_ * 31 + value + player.handle.index();
        }
        if (leakUnsavedState)
            accumulator_ += ++hidden_;
        ++frame_;
    }

    [[nodiscard]] core::i32 frame() const noexcept { return frame_; }
    [[nodiscard]] core::i64 position(core::u32 player) const { return positions_.at(player); }
    [[nodiscard]] core::u64 accumulator() const noexcept { return accumulator_; }

    [[nodiscard]] std::vector<core::byte> serialize() const
    {
        std::vector<core::byte> bytes(sizeof(frame_) + sizeof(accumulator_) + positions_.size() * sizeof(core::i64));
        auto *out = bytes.data();
        std::memcpy(out, &frame_, sizeof(frame_));
        out += sizeof(frame_);
        std::memcpy(out, &accumulator_, sizeof(accumulator_));
        out += sizeof(accumulator_);
        std::memcpy(out, positions_.data(), positions_.size() * sizeof(core::i64));
        return bytes;
    }

    void deserialize(std::span<const core::byte> bytes)
    {
        ++loads;
        const auto *in = bytes.data();
        std::memcpy(&frame_, in, sizeof(frame_));
        in += sizeof(frame_);
        std::memcpy(&accumulator_, in, sizeof(accumulator_));
        in += sizeof(accumulator_);
        std::memcpy(positions_.data(), in, positions_.size() * sizeof(core::i64));
    }

private:
    core::i32              frame_{0};
    core::u64              accumulator_{0};
    core::u64              hidden_{0};
    std::vector<core::i64> positions_;
};

} // namespace rwn::net::test
