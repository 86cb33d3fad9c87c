/**
 * @file InputQueue.cpp
 * @brief InputQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/InputQueue.hpp>
#include <rwn/core/Assert.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::netcode {

InputQueue::InputQueue(core::u32 playerIndex,
                       core::u32 inputSize,
                       core::u32 queueLength,
                       std::shared_ptr<const IPredictionStrategy> predictor)
    : playerIndex_{playerIndex}
    , inputSize_{inputSize}
    , queueLength_{queueLength}
    , predictor_{predictor ? std::move(predictor) : defaultPredictionStrategy()}
    , inputs_(queueLength, GameInput::blank(core::Frame::null(), inputSize))
{
    prediction_ = GameInput::blank(core::Frame::null(), inputSize);
}

core::Expected<void> InputQueue::setFrameDelay(core::u32 delay)
{
    if (delay >= queueLength_)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("frame delay {} does not fit a {}-frame queue", delay, queueLength_));
    }
    frameDelay_ = delay;
    return {};
}

core::Frame InputQueue::oldestFrame() const noexcept
{
    return length_ == 0 ? core::Frame::null() : inputs_[tail_].frame;
}

core::u32 InputQueue::previousSlot(core::u32 slot) const noexcept
{
    return slot == 0 ? queueLength_ - 1 : slot - 1;
}

void InputQueue::pushEntry(const GameInput &input, core::Frame frame)
{
    RWN_ASSERT(length_ < queueLength_);

    inputs_[head_] = input;
    inputs_[head_].frame = frame;
    head_ = (head_ + 1) % queueLength_;
    ++length_;
    lastAddedFrame_ = frame;

    if (prediction_.frame.isNull())
        return;

    RWN_ASSERT(frame == prediction_.frame);

    if (firstIncorrectFrame_.isNull() && !prediction_.sameBits(input))
    {
        core::Log::debug("InputQueue", std::format("player {}: misprediction at frame {}",
                                                   playerIndex_, frame.value()));
        firstIncorrectFrame_ = frame;
    }

    if (prediction_.frame == lastRequestedFrame_ && firstIncorrectFrame_.isNull())
        prediction_.frame = core::Frame::null();
    else
        ++prediction_.frame;
}

core::Expected<core::Frame> InputQueue::addInput(const GameInput &input)
{
    if (!input.frame.isValid() || input.size != inputSize_)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {}: malformed input (frame {}, {} bytes)",
                                           playerIndex_, input.frame.value(), input.size));
    }

    if (!lastUserAddedFrame_.isNull() && input.frame != lastUserAddedFrame_ + 1)
    {
        if (input.frame <= lastUserAddedFrame_)
        {
            return core::makeError(core::ErrorCode::kFrameTooOld,
                                   std::format("player {}: input for frame {} already received",
                                               playerIndex_, input.frame.value()));
        }
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {}: input for frame {} skips frame {}",
                                           playerIndex_, input.frame.value(), (lastUserAddedFrame_ + 1).value()));
    }

    const core::Frame target   = input.frame + static_cast<core::i32>(frameDelay_);
    const core::Frame expected = lastAddedFrame_.isNull() ? core::Frame{0} : lastAddedFrame_ + 1;

    // A shrinking frame delay makes the input land on an already filled frame.
    if (target < expected || target <= confirmedFrame_)
    {
        return core::makeError(core::ErrorCode::kFrameTooOld,
                               std::format("player {}: frame {} is already filled", playerIndex_, target.value()));
    }

    const auto needed = static_cast<core::u32>(target - expected) + 1;
    if (length_ + needed > queueLength_)
    {
        return core::makeError(core::ErrorCode::kInputBufferFull,
                               std::format("player {}: input queue full ({} frames pending)",
                                           playerIndex_, length_));
    }

    // A growing frame delay leaves a hole; fill it by repeating the previous input.
    for (core::Frame frame = expected; frame < target; ++frame)
    {
        const GameInput filler = length_ == 0 && lastAddedFrame_.isNull()
            ? GameInput::blank(frame, inputSize_)
            : inputs_[previousSlot(head_)];
        pushEntry(filler, frame);
    }

    pushEntry(input, target);
    lastUserAddedFrame_ = input.frame;
    return target;
}

core::Expected<std::pair<GameInput, InputStatus>> InputQueue::input(core::Frame frame)
{
    if (!firstIncorrectFrame_.isNull())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               std::format("player {}: prediction error at frame {} not resolved",
                                           playerIndex_, firstIncorrectFrame_.value()));
    }

    if (!frame.isValid() || (length_ > 0 && frame < inputs_[tail_].frame))
    {
        return core::makeError(core::ErrorCode::kFrameTooOld,
                               std::format("player {}: frame {} no longer retained", playerIndex_, frame.value()));
    }

    lastRequestedFrame_ = frame;

    if (prediction_.frame.isNull())
    {
        if (length_ > 0)
        {
            const auto offset = static_cast<core::u32>(frame - inputs_[tail_].frame);
            if (offset < length_)
            {
                const GameInput &entry = inputs_[(tail_ + offset) % queueLength_];
                RWN_ASSERT(entry.frame == frame);
                return std::pair{entry, InputStatus::Confirmed};
            }
        }

        const GameInput *previous = lastAddedFrame_.isNull() ? nullptr : &inputs_[previousSlot(head_)];
        prediction_ = predictor_->predict(frame, previous, inputSize_);
        prediction_.frame = lastAddedFrame_.isNull() ? core::Frame{0} : lastAddedFrame_ + 1;
    }

    GameInput guess = prediction_;
    guess.frame = frame;
    return std::pair{guess, InputStatus::Predicted};
}

core::Expected<GameInput> InputQueue::confirmedInput(core::Frame frame) const
{
    if (length_ > 0 && frame.isValid() && frame >= inputs_[tail_].frame && frame <= lastAddedFrame_)
    {
        const auto offset = static_cast<core::u32>(frame - inputs_[tail_].frame);
        return inputs_[(tail_ + offset) % queueLength_];
    }
    return core::makeError(core::ErrorCode::kNotFound,
                           std::format("player {}: no confirmed input for frame {}", playerIndex_, frame.value()));
}

GameInput InputQueue::frozenInput(core::Frame lastFrame) const
{
    if (length_ == 0 || lastFrame.isNull())
        return GameInput::blank(lastFrame, inputSize_);

    const core::Frame clamped = std::clamp(lastFrame, inputs_[tail_].frame, lastAddedFrame_);
    const auto offset = static_cast<core::u32>(clamped - inputs_[tail_].frame);
    return inputs_[(tail_ + offset) % queueLength_];
}

void InputQueue::confirmUpTo(core::Frame frame)
{
    if (frame.isNull() || lastAddedFrame_.isNull())
        return;

    frame = std::min(frame, lastAddedFrame_);
    confirmedFrame_ = std::max(confirmedFrame_, frame);

    // Replay still needs every frame from the last request onward.
    if (!lastRequestedFrame_.isNull())
        frame = std::min(frame, lastRequestedFrame_);

    if (length_ == 0 || frame <= inputs_[tail_].frame)
        return;

    if (frame >= lastAddedFrame_)
    {
        tail_   = previousSlot(head_);
        length_ = 1;
        return;
    }

    const auto offset = static_cast<core::u32>(frame - inputs_[tail_].frame);
    tail_    = (tail_ + offset) % queueLength_;
    length_ -= offset;
}

void InputQueue::resetPrediction() noexcept
{
    prediction_.frame    = core::Frame::null();
    firstIncorrectFrame_ = core::Frame::null();
    lastRequestedFrame_  = core::Frame::null();
}

std::vector<GameInput> InputQueue::confirmedEntries() const
{
    std::vector<GameInput> out;
    out.reserve(length_);
    for (core::u32 i = 0; i < length_; ++i)
        out.push_back(inputs_[(tail_ + i) % queueLength_]);
    return out;
}

} // namespace rwn::net::netcode
