// /////////////////////////////////////////////////////////////////////////////
/// @file SavedStateRing.hpp
/// @brief Fixed-size ring of host state snapshots used for rollback.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/Types.hpp>

#include <vector>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct SavedState
/// @brief Opaque host snapshot of the state at the start of @c frame.
// /////////////////////////////////////////////////////////////////////////////
struct SavedState
{
    core::Frame             frame{};
    std::vector<core::byte> buffer;
    core::u64               checksum{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class SavedStateRing
/// @brief Snapshots indexed by @c frame % capacity.
///
/// With a capacity of maxPrediction + 1, the snapshot of any frame inside
/// the rollback window is still present, and saving the current frame only
/// ever evicts a frame older than the window.
// /////////////////////////////////////////////////////////////////////////////
class SavedStateRing final
{
public:
    /// @param maxPrediction Rollback window; capacity is one more.
    explicit SavedStateRing(core::u32 maxPrediction);

    /// @brief Stores a snapshot, overwriting whatever shared its slot.
    /// @return kInvalidRequest for a null frame.
    [[nodiscard]] core::Expected<void> save(core::Frame frame,
                                            std::vector<core::byte> buffer,
                                            core::u64 checksum);

    /// @brief Snapshot of @p frame.
    /// @return kFrameTooOld when it was evicted by a newer frame,
    ///         kNotFound when it was never saved (or invalidated).
    [[nodiscard]] core::Expected<const SavedState *> load(core::Frame frame) const;

    /// @brief Snapshot of @p frame, or nullptr.
    [[nodiscard]] const SavedState *find(core::Frame frame) const noexcept;

    /// @brief Drops every snapshot newer than @p frame.
    void invalidateAfter(core::Frame frame) noexcept;

    /// @brief Oldest retained snapshot frame (null when empty).
    [[nodiscard]] core::Frame oldestFrame() const noexcept;

    /// @brief Newest retained snapshot frame (null when empty).
    [[nodiscard]] core::Frame newestFrame() const noexcept;

    [[nodiscard]] core::usize capacity() const noexcept { return slots_.size(); }

private:
    std::vector<SavedState> slots_;
};

} // namespace rwn::net::netcode
