/**
 * @file TestFrame.cpp
 * @brief Unit tests for core::Frame and core::PlayerHandle.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/core/Frame.hpp"

#include <algorithm>

namespace rwn::core {

TEST_CASE("Frame default is null and orders before frame zero", "[core][frame]")
{
    Frame f;
    REQUIRE(f.isNull());
    REQUIRE_FALSE(f.isValid());
    REQUIRE(f == Frame::null());
    REQUIRE(f < Frame{0});
    REQUIRE(std::max(Frame::null(), Frame{3}) == Frame{3});
}

TEST_CASE("Frame negative construction collapses to null", "[core][frame]")
{
    REQUIRE(Frame{-42}.isNull());
    REQUIRE(Frame{-42}.value() == Frame::kNullValue);
}

TEST_CASE("Frame offset arithmetic saturates", "[core][frame]")
{
    REQUIRE((Frame{10} + 5).value() == 15);
    REQUIRE((Frame{10} - 5).value() == 5);
    REQUIRE((Frame{2} - 10).isNull());
    REQUIRE((Frame{Frame::kMaxValue} + 1).value() == Frame::kMaxValue);

    Frame f{Frame::kMaxValue};
    ++f;
    REQUIRE(f.value() == Frame::kMaxValue);
}

TEST_CASE("Frame checkedAdd reports overflow instead of wrapping", "[core][frame]")
{
    auto ok = Frame{7}.checkedAdd(3);
    REQUIRE(ok.has_value());
    REQUIRE(ok->value() == 10);

    auto overflow = Frame{Frame::kMaxValue}.checkedAdd(1);
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code() == ErrorCode::kInvalidRequest);

    REQUIRE_FALSE(Frame{1}.checkedAdd(-2).has_value());
    REQUIRE_FALSE(Frame::null().checkedAdd(1).has_value());
}

TEST_CASE("Frame distance and ring slot", "[core][frame]")
{
    REQUIRE(Frame{12} - Frame{4} == 8);
    REQUIRE(Frame{4} - Frame{12} == -8);
    REQUIRE(Frame{0} - Frame::null() == 1);
    REQUIRE(Frame{13}.slot(9) == 4);
}

TEST_CASE("PlayerHandle validates against player count", "[core][frame]")
{
    auto ok = PlayerHandle::create(1, 2);
    REQUIRE(ok.has_value());
    REQUIRE(ok->index() == 1);

    auto bad = PlayerHandle::create(2, 2);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidPlayer);

    REQUIRE(PlayerHandle{3}.isValidFor(4));
    REQUIRE_FALSE(PlayerHandle{4}.isValidFor(4));
    REQUIRE(PlayerHandle{0} < PlayerHandle{1});
}

} // namespace rwn::core
