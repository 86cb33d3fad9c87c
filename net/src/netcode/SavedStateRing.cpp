/**
 * @file SavedStateRing.cpp
 * @brief SavedStateRing implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/SavedStateRing.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::netcode {

SavedStateRing::SavedStateRing(core::u32 maxPrediction)
    : slots_(static_cast<core::usize>(maxPrediction) + 1)
{}

core::Expected<void> SavedStateRing::save(core::Frame frame,
                                          std::vector<core::byte> buffer,
                                          core::u64 checksum)
{
    if (!frame.isValid())
        return core::makeError(core::ErrorCode::kInvalidRequest, "cannot save state for the null frame");

    SavedState &slot = slots_[frame.slot(slots_.size())];
    slot.frame    = frame;
    slot.buffer   = std::move(buffer);
    slot.checksum = checksum;
    return {};
}

core::Expected<const SavedState *> SavedStateRing::load(core::Frame frame) const
{
    if (const SavedState *state = find(frame))
        return state;

    const core::Frame oldest = oldestFrame();
    if (frame.isValid() && !oldest.isNull() && frame < oldest)
    {
        return core::makeError(core::ErrorCode::kFrameTooOld,
                               std::format("state for frame {} evicted (oldest: {})",
                                           frame.value(), oldest.value()));
    }
    return core::makeError(core::ErrorCode::kNotFound,
                           std::format("no saved state for frame {}", frame.value()));
}

const SavedState *SavedStateRing::find(core::Frame frame) const noexcept
{
    if (!frame.isValid())
        return nullptr;
    const SavedState &slot = slots_[frame.slot(slots_.size())];
    return slot.frame == frame ? &slot : nullptr;
}

void SavedStateRing::invalidateAfter(core::Frame frame) noexcept
{
    for (SavedState &slot : slots_)
    {
        if (slot.frame > frame)
        {
            slot.frame = core::Frame::null();
            slot.buffer.clear();
            slot.checksum = 0;
        }
    }
}

core::Frame SavedStateRing::oldestFrame() const noexcept
{
    core::Frame oldest{};
    for (const SavedState &slot : slots_)
    {
        if (slot.frame.isValid() && (oldest.isNull() || slot.frame < oldest))
            oldest = slot.frame;
    }
    return oldest;
}

core::Frame SavedStateRing::newestFrame() const noexcept
{
    core::Frame newest{};
    for (const SavedState &slot : slots_)
        newest = std::max(newest, slot.frame);
    return newest;
}

} // namespace rwn::net::netcode
