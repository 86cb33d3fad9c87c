/**
 * @file StateHash.cpp
 * @brief FNV-1a byte loop.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwn/math/StateHash.hpp"

namespace rwn::math {

StateHash &StateHash::hashBytes(std::span<const core::byte> data)
{
    for (const core::byte b : data)
    {
        hash_ ^= static_cast<core::u64>(b);
        hash_ *= kPrime;
    }
    return *this;
}

core::u64 StateHash::of(std::span<const core::byte> data)
{
    return StateHash{}.hashBytes(data).digest();
}

} // namespace rwn::math
