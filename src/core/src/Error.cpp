/**
 * @file Error.cpp
 * @brief Printable names for error codes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "hop/core/Error.hpp"

namespace hop::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                  return "None";
    case ErrorCode::kInvalidArgument:       return "InvalidArgument";
    case ErrorCode::kInvalidState:          return "InvalidState";
    case ErrorCode::kNotFound:              return "NotFound";
    case ErrorCode::kAlreadyExists:         return "AlreadyExists";
    case ErrorCode::kTimeout:               return "Timeout";
    case ErrorCode::kOutOfRange:            return "OutOfRange";
    case ErrorCode::kIoError:               return "IoError";
    case ErrorCode::kNotSupported:          return "NotSupported";
    case ErrorCode::kCorruptedData:         return "CorruptedData";
    case ErrorCode::kNetworkConnectFailed:  return "NetworkConnectFailed";
    case ErrorCode::kNetworkSendFailed:     return "NetworkSendFailed";
    case ErrorCode::kNetworkReceiveFailed:  return "NetworkReceiveFailed";
    case ErrorCode::kNetworkDisconnected:   return "NetworkDisconnected";
    case ErrorCode::kProtocolViolation:     return "ProtocolViolation";
    case ErrorCode::kMessageTooLarge:       return "MessageTooLarge";
    case ErrorCode::kSerializationFailed:   return "SerializationFailed";
    case ErrorCode::kDeserializationFailed: return "DeserializationFailed";
    case ErrorCode::kCompressionFailed:     return "CompressionFailed";
    case ErrorCode::kDecompressionFailed:   return "DecompressionFailed";
    case ErrorCode::kCaptureFailure:        return "CaptureFailure";
    case ErrorCode::kTransportFailure:      return "TransportFailure";
    case ErrorCode::kRestoreFailure:        return "RestoreFailure";
    case ErrorCode::kBaselineMismatch:      return "BaselineMismatch";
    case ErrorCode::kMigrationRejected:     return "MigrationRejected";
    case ErrorCode::kLivenessLost:          return "LivenessLost";
    case ErrorCode::kInternalError:         return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string out{toString(_code)};
    out += ": ";
    out += _message;
    return out;
}

} // namespace hop::core
