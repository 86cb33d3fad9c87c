/**
 * @file TestStateHash.cpp
 * @brief Unit tests for math::StateHash.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/math/StateHash.hpp"

#include <array>
#include <cstring>

namespace rwn::math {

TEST_CASE("StateHash of empty input is the offset basis", "[math][hash]")
{
    REQUIRE(StateHash::of({}) == StateHash::kOffsetBasis);
}

TEST_CASE("StateHash matches the FNV-1a reference vector", "[math][hash]")
{
    const char *text = "a";
    std::array<core::byte, 1> bytes{};
    std::memcpy(bytes.data(), text, 1);
    REQUIRE(StateHash::of(bytes) == 0xaf63dc4c8601ec8cULL);
}

TEST_CASE("StateHash changes when a single state byte changes", "[math][hash]")
{
    std::array<core::byte, 64> state{};
    for (std::size_t i = 0; i < state.size(); ++i)
        state[i] = static_cast<core::byte>(i * 7);

    const auto before = StateHash::of(state);
    state[33] ^= core::byte{0x01};
    REQUIRE(StateHash::of(state) != before);
}

TEST_CASE("StateHash combine chains like hashBytes", "[math][hash]")
{
    core::u32 value = 0xDEADBEEF;
    StateHash a;
    a.combine(value).combine(core::u8{7});

    std::array<core::byte, 5> raw{};
    std::memcpy(raw.data(), &value, 4);
    raw[4] = core::byte{7};
    REQUIRE(a.digest() == StateHash::of(raw));

    a.reset();
    REQUIRE(a.digest() == StateHash::kOffsetBasis);
}

} // namespace rwn::math
