/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash for deterministic desync detection.
 *
 * Each saved frame carries a 64-bit digest of the host's serialized
 * state. Peers exchange digests of confirmed frames; a mismatch signals a
 * determinism failure in the host simulation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_MATH_STATE_HASH_HPP
    #define RWN_MATH_STATE_HASH_HPP

    #include <rwn/core/Concepts.hpp>
    #include <rwn/core/Types.hpp>

    #include <span>

namespace rwn::math {

/**
 * @brief Incremental FNV-1a (64-bit) hasher.
 */
class StateHash final
{
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data);

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <core::Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const core::byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    [[nodiscard]] constexpr core::u64 digest() const { return hash_; }

    constexpr void reset() { hash_ = kOffsetBasis; }

    /// @brief One-shot digest of a byte buffer.
    [[nodiscard]] static core::u64 of(std::span<const core::byte> data);

private:
    core::u64 hash_ = kOffsetBasis;
};

} // namespace rwn::math

#endif // RWN_MATH_STATE_HASH_HPP
