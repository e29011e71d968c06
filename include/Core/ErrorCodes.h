#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and their log names.
 */

#include <stddef.h>
#include <stdint.h>

enum class ErrorCode : uint16_t {
    Ok = 0,
    BadJson,
    MissingCmd,
    UnknownCmd,
    MissingField,
    InvalidTime,
    InvalidId,
    InvalidPort,
    InvalidTask,
    NotFound,
    DuplicateId,
    CapacityExceeded,
    StorageEmpty,
    StorageCorrupt,
    StorageWriteFailed,
    StorageUnavailable,
    PayloadTooLarge,
    EncodeOverflow,
    NotConnected,
    CfgApplyFailed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Ok: return "Ok";
    case ErrorCode::BadJson: return "BadJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::MissingField: return "MissingField";
    case ErrorCode::InvalidTime: return "InvalidTime";
    case ErrorCode::InvalidId: return "InvalidId";
    case ErrorCode::InvalidPort: return "InvalidPort";
    case ErrorCode::InvalidTask: return "InvalidTask";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::DuplicateId: return "DuplicateId";
    case ErrorCode::CapacityExceeded: return "CapacityExceeded";
    case ErrorCode::StorageEmpty: return "StorageEmpty";
    case ErrorCode::StorageCorrupt: return "StorageCorrupt";
    case ErrorCode::StorageWriteFailed: return "StorageWriteFailed";
    case ErrorCode::StorageUnavailable: return "StorageUnavailable";
    case ErrorCode::PayloadTooLarge: return "PayloadTooLarge";
    case ErrorCode::EncodeOverflow: return "EncodeOverflow";
    case ErrorCode::NotConnected: return "NotConnected";
    case ErrorCode::CfgApplyFailed: return "CfgApplyFailed";
    default: return "Unknown";
    }
}

/** @brief Decode-stage failures: the message is dropped before touching the table. */
static inline bool errorCodeIsDecode(ErrorCode code)
{
    switch (code) {
    case ErrorCode::BadJson:
    case ErrorCode::MissingCmd:
    case ErrorCode::UnknownCmd:
    case ErrorCode::MissingField:
    case ErrorCode::InvalidTime:
    case ErrorCode::InvalidId:
    case ErrorCode::InvalidPort:
    case ErrorCode::InvalidTask:
    case ErrorCode::PayloadTooLarge:
        return true;
    default:
        return false;
    }
}
