#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    None = 0,
    UnknownCmd,
    BadCmdJson,
    MissingCmd,
    CmdServiceUnavailable,
    ArgsTooLarge,
    CmdHandlerFailed,
    BadCfgJson,
    CfgServiceUnavailable,
    CfgApplyFailed,
    CfgTruncated,
    MissingArgs,
    MissingValue,
    InvalidValue,
    NotReady,
    Disabled,
    IoError,
    Failed,
    Timeout,
    ConnectionNotReady,
    ClientClosed,
    StreamEnded,
    StatusTooLarge,
    BadStatusJson,
    UnsupportedModel,
    UnsupportedFilter,
    UnsupportedFeature,
    ShuttingDown
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::BadCmdJson: return "BadCmdJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::CmdServiceUnavailable: return "CmdServiceUnavailable";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::CmdHandlerFailed: return "CmdHandlerFailed";
    case ErrorCode::BadCfgJson: return "BadCfgJson";
    case ErrorCode::CfgServiceUnavailable: return "CfgServiceUnavailable";
    case ErrorCode::CfgApplyFailed: return "CfgApplyFailed";
    case ErrorCode::CfgTruncated: return "CfgTruncated";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::InvalidValue: return "InvalidValue";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::Disabled: return "Disabled";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::Failed: return "Failed";
    case ErrorCode::Timeout: return "Timeout";
    case ErrorCode::ConnectionNotReady: return "ConnectionNotReady";
    case ErrorCode::ClientClosed: return "ClientClosed";
    case ErrorCode::StreamEnded: return "StreamEnded";
    case ErrorCode::StatusTooLarge: return "StatusTooLarge";
    case ErrorCode::BadStatusJson: return "BadStatusJson";
    case ErrorCode::UnsupportedModel: return "UnsupportedModel";
    case ErrorCode::UnsupportedFilter: return "UnsupportedFilter";
    case ErrorCode::UnsupportedFeature: return "UnsupportedFeature";
    case ErrorCode::ShuttingDown: return "ShuttingDown";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::CfgServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::IoError:
    case ErrorCode::Timeout:
    case ErrorCode::ConnectionNotReady:
    case ErrorCode::ClientClosed:
    case ErrorCode::CfgTruncated:
        return true;
    default:
        return false;
    }
}

static inline void setError(ErrorCode* out, ErrorCode code)
{
    if (out) *out = code;
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}

static inline bool writeOkJson(char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    const int wrote = snprintf(out, outLen, "{\"ok\":true}");
    return (wrote > 0) && ((size_t)wrote < outLen);
}
