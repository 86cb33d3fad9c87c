/**
 * @file TestSyncLayer.cpp
 * @brief Unit tests for netcode::SyncLayer and netcode::TimeSync.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/netcode/SyncLayer.hpp"
#include "rwn/net/netcode/TimeSync.hpp"

namespace rwn::net::netcode {

namespace {

constexpr core::u32 kInputSize = 1;

GameInput makeInput(core::Frame frame, core::u8 value)
{
    const core::byte raw[kInputSize] = {core::byte{value}};
    return GameInput::fromBytes(frame, raw).value();
}

std::vector<core::byte> snapshot(core::i32 frame)
{
    return std::vector<core::byte>(2, core::byte{static_cast<core::u8>(frame)});
}

SyncLayer makeLayer(core::u32 players = 2, core::u32 maxPrediction = 4)
{
    return SyncLayer{players, maxPrediction, kInputSize, 32, nullptr};
}

} // namespace

TEST_CASE("SyncLayer starts at frame zero with nothing confirmed", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    REQUIRE(layer.currentFrame() == core::Frame{0});
    REQUIRE(layer.lastConfirmedFrame().isNull());
    REQUIRE(layer.lastSavedFrame().isNull());
    REQUIRE(layer.checkSimulationConsistency().isNull());
}

TEST_CASE("SyncLayer synchronized inputs mix confirmed and predicted", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(core::Frame{0}, 5)).has_value());

    const std::vector<ConnectionStatus> statuses(2);
    auto inputs = layer.synchronizedInputs(statuses);
    REQUIRE(inputs.has_value());
    REQUIRE(inputs->size() == 2);
    REQUIRE((*inputs)[0].status == InputStatus::Confirmed);
    REQUIRE((*inputs)[0].input.bits[0] == core::byte{5});
    REQUIRE((*inputs)[1].predicted());
}

TEST_CASE("SyncLayer freezes a disconnected player's input", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    REQUIRE(layer.addRemoteInput(core::PlayerHandle{1}, makeInput(core::Frame{0}, 3)).has_value());
    REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(core::Frame{0}, 1)).has_value());
    layer.advanceFrame();
    REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(core::Frame{1}, 1)).has_value());

    std::vector<ConnectionStatus> statuses(2);
    statuses[1] = {true, core::Frame{0}};
    auto inputs = layer.synchronizedInputs(statuses).value();
    REQUIRE(inputs[1].status == InputStatus::Disconnected);
    REQUIRE(inputs[1].input.bits[0] == core::byte{3});
    REQUIRE(inputs[1].input.frame == core::Frame{1});
}

TEST_CASE("SyncLayer rejects local input for the wrong frame and bad handles", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    auto wrongFrame = layer.addLocalInput(core::PlayerHandle{0}, makeInput(core::Frame{3}, 1));
    REQUIRE_FALSE(wrongFrame.has_value());
    REQUIRE(wrongFrame.error().code() == core::ErrorCode::kInvalidRequest);

    auto badHandle = layer.addRemoteInput(core::PlayerHandle{7}, makeInput(core::Frame{0}, 1));
    REQUIRE_FALSE(badHandle.has_value());
    REQUIRE(badHandle.error().code() == core::ErrorCode::kInvalidPlayer);
}

TEST_CASE("SyncLayer enforces the prediction barrier", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer(2, 3);
    for (core::i32 f = 0; f < 3; ++f)
    {
        REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(layer.currentFrame(), 1)).has_value());
        layer.advanceFrame();
    }

    auto blocked = layer.addLocalInput(core::PlayerHandle{0}, makeInput(layer.currentFrame(), 1));
    REQUIRE_FALSE(blocked.has_value());
    REQUIRE(blocked.error().code() == core::ErrorCode::kPredictionThreshold);
    REQUIRE_FALSE(core::isFatal(blocked.error().code()));

    REQUIRE(layer.addRemoteInput(core::PlayerHandle{1}, makeInput(core::Frame{0}, 1)).has_value());
    REQUIRE(layer.addRemoteInput(core::PlayerHandle{1}, makeInput(core::Frame{1}, 1)).has_value());
    layer.setLastConfirmedFrame(core::Frame{1});
    REQUIRE(layer.lastConfirmedFrame() == core::Frame{1});
    REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(layer.currentFrame(), 1)).has_value());
}

TEST_CASE("SyncLayer rollback restores the saved frame", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer(2, 4);
    for (core::i32 f = 0; f < 4; ++f)
    {
        REQUIRE(layer.saveCurrentState(snapshot(f), static_cast<core::u64>(100 + f)).has_value());
        layer.advanceFrame();
    }
    REQUIRE(layer.saveCurrentState(snapshot(4), 104).has_value());

    auto loaded = layer.loadFrame(core::Frame{1});
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->buffer == snapshot(1));
    REQUIRE((*loaded)->checksum == 101);
    REQUIRE(layer.currentFrame() == core::Frame{1});
    REQUIRE(layer.lastSavedFrame() == core::Frame{1});
    REQUIRE(layer.savedState(core::Frame{3}) == nullptr);
}

TEST_CASE("SyncLayer load rejects frames outside the rollback window", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer(2, 2);
    for (core::i32 f = 0; f < 5; ++f)
    {
        REQUIRE(layer.saveCurrentState(snapshot(f), 0).has_value());
        layer.advanceFrame();
    }

    auto tooOld = layer.loadFrame(core::Frame{1});
    REQUIRE_FALSE(tooOld.has_value());
    REQUIRE(tooOld.error().code() == core::ErrorCode::kPredictionWindowExceeded);
    REQUIRE(core::isFatal(tooOld.error().code()));

    auto present = layer.loadFrame(core::Frame{5});
    REQUIRE_FALSE(present.has_value());
    REQUIRE(present.error().code() == core::ErrorCode::kInvalidRequest);
}

TEST_CASE("SyncLayer confirmed frame never exceeds the current frame", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    layer.advanceFrame();
    layer.advanceFrame();
    layer.setLastConfirmedFrame(core::Frame{10});
    REQUIRE(layer.lastConfirmedFrame() == core::Frame{2});

    layer.setLastConfirmedFrame(core::Frame{1});
    REQUIRE(layer.lastConfirmedFrame() == core::Frame{2});
}

TEST_CASE("SyncLayer can hold the confirmed frame at the last snapshot", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    REQUIRE(layer.saveCurrentState(snapshot(0), 0).has_value());
    for (core::i32 f = 0; f < 3; ++f)
        layer.advanceFrame();

    layer.setLastConfirmedFrame(core::Frame{3}, true);
    REQUIRE(layer.lastConfirmedFrame() == core::Frame{0});

    REQUIRE(layer.saveCurrentState(snapshot(3), 3).has_value());
    layer.setLastConfirmedFrame(core::Frame{3}, true);
    REQUIRE(layer.lastConfirmedFrame() == core::Frame{3});
}

TEST_CASE("SyncLayer confirmed inputs come from the queues or the freeze point", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer();
    for (core::i32 f = 0; f < 3; ++f)
    {
        REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(core::Frame{f}, static_cast<core::u8>(f + 1)))
                    .has_value());
        REQUIRE(layer.addRemoteInput(core::PlayerHandle{1}, makeInput(core::Frame{f}, 4)).has_value());
        layer.advanceFrame();
    }

    std::vector<ConnectionStatus> statuses(2);
    auto inputs = layer.confirmedInputs(core::Frame{1}, statuses);
    REQUIRE(inputs.has_value());
    REQUIRE(inputs->size() == 2);
    REQUIRE((*inputs)[0].status == InputStatus::Confirmed);
    REQUIRE((*inputs)[0].input.bits[0] == core::byte{2});
    REQUIRE((*inputs)[1].input.bits[0] == core::byte{4});

    auto missing = layer.confirmedInputs(core::Frame{5}, statuses);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kNotFound);

    statuses[1] = {true, core::Frame{0}};
    auto frozen = layer.confirmedInputs(core::Frame{2}, statuses).value();
    REQUIRE(frozen[1].status == InputStatus::Disconnected);
    REQUIRE(frozen[1].input.frame == core::Frame{2});
    REQUIRE(frozen[1].input.bits[0] == core::byte{4});

    const std::vector<ConnectionStatus> wrongSize(3);
    REQUIRE(layer.confirmedInputs(core::Frame{1}, wrongSize).error().code() == core::ErrorCode::kInternalError);
}

TEST_CASE("SyncLayer reports the earliest incorrect frame across players", "[netcode][synclayer]")
{
    SyncLayer layer = makeLayer(3, 8);
    const std::vector<ConnectionStatus> statuses(3);
    for (core::i32 f = 0; f < 4; ++f)
    {
        REQUIRE(layer.addLocalInput(core::PlayerHandle{0}, makeInput(layer.currentFrame(), 0)).has_value());
        REQUIRE(layer.synchronizedInputs(statuses).has_value());
        layer.advanceFrame();
    }

    for (core::i32 f = 0; f < 4; ++f)
        REQUIRE(layer.addRemoteInput(core::PlayerHandle{1}, makeInput(core::Frame{f}, f >= 2 ? 1 : 0)).has_value());
    for (core::i32 f = 0; f < 4; ++f)
        REQUIRE(layer.addRemoteInput(core::PlayerHandle{2}, makeInput(core::Frame{f}, f >= 1 ? 1 : 0)).has_value());

    REQUIRE(layer.checkSimulationConsistency() == core::Frame{1});
    REQUIRE(layer.checkSimulationConsistency(core::Frame{0}) == core::Frame{0});
    REQUIRE(layer.inputQueue(core::PlayerHandle{1}).firstIncorrectFrame() == core::Frame{2});

    layer.resetPrediction();
    REQUIRE(layer.checkSimulationConsistency().isNull());
}

TEST_CASE("TimeSync averages half the advantage difference", "[netcode][timesync]")
{
    TimeSync sync;
    REQUIRE(sync.averageFrameAdvantage() == 0);

    for (core::i32 f = 0; f < static_cast<core::i32>(core::kFrameWindowSize); ++f)
        sync.advanceFrame(core::Frame{f}, -4, 4);
    REQUIRE(sync.averageFrameAdvantage() == 4);

    for (core::i32 f = 0; f < static_cast<core::i32>(core::kFrameWindowSize); ++f)
        sync.advanceFrame(core::Frame{f}, 2, -2);
    REQUIRE(sync.averageFrameAdvantage() == -2);
}

} // namespace rwn::net::netcode
