/**
 * @file RingBuffer.inl
 * @brief Template implementation of the SPSC lock-free ring buffer.
 * @see   RingBuffer.hpp
 */

#ifndef RWN_CONTAINER_RING_BUFFER_INL
    #define RWN_CONTAINER_RING_BUFFER_INL

namespace rwn::container {

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::push(const T &item)
{
    const auto tail = tail_.load(std::memory_order_relaxed);
    const auto next = (tail + 1) & kMask;

    if (next == head_.load(std::memory_order_acquire))
        return false;

    buffer_[tail] = item;
    tail_.store(next, std::memory_order_release);
    return true;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::pop(T &item)
{
    const auto head = head_.load(std::memory_order_relaxed);

    if (head == tail_.load(std::memory_order_acquire))
        return false;

    item = buffer_[head];
    head_.store((head + 1) & kMask, std::memory_order_release);
    return true;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::drain(std::span<T> out)
{
    core::usize count = 0;
    while (count < out.size() && pop(out[count]))
        ++count;
    return count;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isFull() const
{
    const auto next = (tail_.load(std::memory_order_acquire) + 1) & kMask;
    return next == head_.load(std::memory_order_acquire);
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isEmpty() const
{
    return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::size() const
{
    const auto h = head_.load(std::memory_order_acquire);
    const auto t = tail_.load(std::memory_order_acquire);
    return (t - h) & kMask;
}

} // namespace rwn::container

#endif // RWN_CONTAINER_RING_BUFFER_INL
