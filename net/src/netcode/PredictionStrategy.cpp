/**
 * @file PredictionStrategy.cpp
 * @brief Built-in input prediction strategies.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/IPredictionStrategy.hpp>

namespace rwn::net::netcode {

GameInput RepeatLastConfirmed::predict(core::Frame frame,
                                       const GameInput *previous,
                                       core::u32 inputSize) const
{
    if (previous == nullptr)
        return GameInput::blank(frame, inputSize);

    GameInput guess = *previous;
    guess.frame = frame;
    return guess;
}

GameInput BlankPrediction::predict(core::Frame frame,
                                   const GameInput * /*previous*/,
                                   core::u32 inputSize) const
{
    return GameInput::blank(frame, inputSize);
}

std::shared_ptr<const IPredictionStrategy> defaultPredictionStrategy()
{
    static const auto kDefault = std::make_shared<const RepeatLastConfirmed>();
    return kDefault;
}

} // namespace rwn::net::netcode
