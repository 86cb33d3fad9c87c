// /////////////////////////////////////////////////////////////////////////////
/// @file IPredictionStrategy.hpp
/// @brief Strategy interface for guessing a remote player's missing input.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/GameInput.hpp>

#include <memory>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @class IPredictionStrategy
/// @brief Produces the input used for a frame whose real input is unknown.
///
/// Implementations must be pure functions of their arguments: every peer
/// that rolls back and re-predicts must obtain the same value, and a
/// prediction is memoised by the InputQueue until real input arrives.
// /////////////////////////////////////////////////////////////////////////////
class IPredictionStrategy
{
public:
    virtual ~IPredictionStrategy() = default;

    /// @brief Predicts the input of @p frame.
    /// @param frame     Frame being predicted.
    /// @param previous  Most recent real input of the player, or nullptr.
    /// @param inputSize Payload size for this session.
    [[nodiscard]] virtual GameInput predict(core::Frame frame,
                                            const GameInput *previous,
                                            core::u32 inputSize) const = 0;

    /// @brief Human-readable strategy name.
    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class RepeatLastConfirmed
/// @brief Predicts that the player keeps doing what they last did.
// /////////////////////////////////////////////////////////////////////////////
class RepeatLastConfirmed final : public IPredictionStrategy
{
public:
    [[nodiscard]] GameInput predict(core::Frame frame,
                                    const GameInput *previous,
                                    core::u32 inputSize) const override;

    [[nodiscard]] const char *name() const noexcept override { return "RepeatLastConfirmed"; }
};

// /////////////////////////////////////////////////////////////////////////////
/// @class BlankPrediction
/// @brief Predicts an all-zero input.
// /////////////////////////////////////////////////////////////////////////////
class BlankPrediction final : public IPredictionStrategy
{
public:
    [[nodiscard]] GameInput predict(core::Frame frame,
                                    const GameInput *previous,
                                    core::u32 inputSize) const override;

    [[nodiscard]] const char *name() const noexcept override { return "BlankPrediction"; }
};

/// @brief Shared default strategy (RepeatLastConfirmed).
[[nodiscard]] std::shared_ptr<const IPredictionStrategy> defaultPredictionStrategy();

} // namespace rwn::net::netcode
