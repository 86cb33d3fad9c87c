/**
 * @file RingBuffer.hpp
 * @brief Single-producer single-consumer lock-free ring buffer.
 *
 * Hands received datagrams from the network I/O thread to the simulation
 * thread. Capacity must be a power of two; one slot is kept free to
 * distinguish full from empty, so at most Capacity - 1 items are queued.
 *
 * @tparam T        Element type (must be trivially copyable).
 * @tparam Capacity Number of slots (compile-time, power of two).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CONTAINER_RING_BUFFER_HPP
    #define RWN_CONTAINER_RING_BUFFER_HPP

    #include <rwn/core/Types.hpp>

    #include <array>
    #include <atomic>
    #include <bit>
    #include <new>
    #include <span>
    #include <type_traits>

namespace rwn::container {

/**
 * @brief SPSC lock-free circular buffer.
 *
 * The producer only writes @c tail_, the consumer only writes @c head_;
 * acquire/release ordering publishes the slot contents.
 */
template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity) && std::is_trivially_copyable_v<T>)
class RingBuffer final
{
public:
    /**
     * @brief Push one element (producer side).
     * @return False if the buffer is full; the element is not queued.
     */
    bool push(const T &item);

    /**
     * @brief Pop one element (consumer side).
     * @param[out] item Destination for the dequeued element.
     * @return False if the buffer is empty.
     */
    bool pop(T &item);

    /**
     * @brief Drain up to out.size() elements (consumer side).
     * @return Number of elements drained.
     */
    core::usize drain(std::span<T> out);

    [[nodiscard]] bool        isFull()  const;
    [[nodiscard]] bool        isEmpty() const;
    [[nodiscard]] core::usize size()    const;

    [[nodiscard]] static constexpr core::usize capacity() noexcept { return Capacity - 1; }

private:
    static constexpr core::usize kMask = Capacity - 1;
    static constexpr core::usize kCacheLine = 64;

    std::array<T, Capacity>                     buffer_{};
    alignas(kCacheLine) std::atomic<core::usize> head_{0};
    alignas(kCacheLine) std::atomic<core::usize> tail_{0};
};

} // namespace rwn::container

    #include "RingBuffer.inl"

#endif // RWN_CONTAINER_RING_BUFFER_HPP
