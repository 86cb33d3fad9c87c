/**
 * @file TestSavedStateRing.cpp
 * @brief Unit tests for netcode::SavedStateRing.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/netcode/SavedStateRing.hpp"

namespace rwn::net::netcode {

namespace {

std::vector<core::byte> bytesOf(core::u8 value)
{
    return std::vector<core::byte>(4, core::byte{value});
}

} // namespace

TEST_CASE("SavedStateRing capacity is one past the prediction window", "[netcode][savedstate]")
{
    SavedStateRing ring{8};
    REQUIRE(ring.capacity() == 9);
    REQUIRE(ring.oldestFrame().isNull());
}

TEST_CASE("SavedStateRing loads what was saved", "[netcode][savedstate]")
{
    SavedStateRing ring{4};
    REQUIRE(ring.save(core::Frame{3}, bytesOf(3), 33).has_value());

    auto loaded = ring.load(core::Frame{3});
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->frame == core::Frame{3});
    REQUIRE((*loaded)->checksum == 33);
    REQUIRE((*loaded)->buffer == bytesOf(3));
}

TEST_CASE("SavedStateRing distinguishes evicted from missing frames", "[netcode][savedstate]")
{
    SavedStateRing ring{2};
    for (core::i32 f = 0; f < 6; ++f)
        REQUIRE(ring.save(core::Frame{f}, bytesOf(static_cast<core::u8>(f)), static_cast<core::u64>(f)).has_value());

    REQUIRE(ring.oldestFrame() == core::Frame{3});
    REQUIRE(ring.newestFrame() == core::Frame{5});

    auto evicted = ring.load(core::Frame{1});
    REQUIRE_FALSE(evicted.has_value());
    REQUIRE(evicted.error().code() == core::ErrorCode::kFrameTooOld);

    auto future = ring.load(core::Frame{9});
    REQUIRE_FALSE(future.has_value());
    REQUIRE(future.error().code() == core::ErrorCode::kNotFound);
}

TEST_CASE("SavedStateRing invalidates snapshots newer than a rollback target", "[netcode][savedstate]")
{
    SavedStateRing ring{8};
    for (core::i32 f = 0; f < 5; ++f)
        REQUIRE(ring.save(core::Frame{f}, bytesOf(1), 1).has_value());

    ring.invalidateAfter(core::Frame{2});
    REQUIRE(ring.find(core::Frame{2}) != nullptr);
    REQUIRE(ring.find(core::Frame{3}) == nullptr);
    REQUIRE(ring.newestFrame() == core::Frame{2});
}

TEST_CASE("SavedStateRing rejects the null frame", "[netcode][savedstate]")
{
    SavedStateRing ring{4};
    auto result = ring.save(core::Frame::null(), bytesOf(0), 0);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidRequest);
}

} // namespace rwn::net::netcode
