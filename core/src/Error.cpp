/**
 * @file Error.cpp
 * @brief Error code names and formatting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwn/core/Error.hpp"

#include <format>

namespace rwn::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                     return "None";
    case ErrorCode::kInvalidPlayer:            return "InvalidPlayer";
    case ErrorCode::kFrameTooOld:              return "FrameTooOld";
    case ErrorCode::kNotFound:                 return "NotFound";
    case ErrorCode::kInputBufferFull:          return "InputBufferFull";
    case ErrorCode::kPredictionThreshold:      return "PredictionThreshold";
    case ErrorCode::kPredictionWindowExceeded: return "PredictionWindowExceeded";
    case ErrorCode::kDisconnected:             return "Disconnected";
    case ErrorCode::kDesyncDetected:           return "DesyncDetected";
    case ErrorCode::kNotSynchronized:          return "NotSynchronized";
    case ErrorCode::kInvalidConfig:            return "InvalidConfig";
    case ErrorCode::kInvalidRequest:           return "InvalidRequest";
    case ErrorCode::kInvalidState:             return "InvalidState";
    case ErrorCode::kMismatchedChecksum:       return "MismatchedChecksum";
    case ErrorCode::kMalformedMessage:         return "MalformedMessage";
    case ErrorCode::kIoError:                  return "IoError";
    case ErrorCode::kInternalError:            return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    return std::format("{}: {}", errorCodeName(code_), message_);
}

} // namespace rwn::core
