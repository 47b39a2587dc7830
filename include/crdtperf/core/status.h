#pragma once
/**
 * @file status.h
 * @brief Result codes shared by the optimization and monitoring components
 */

#include "crdtperf/core/types.h"

namespace crdtperf {

/**
 * @brief Result codes for recoverable operations
 */
enum class Status : UInt8 {
    Success = 0,

    // Configuration errors
    InvalidConfiguration,
    UnknownRule,
    InvalidArgument,

    // Lifecycle errors
    AlreadyRunning,
    NotRunning,
    ShuttingDown,
    Timeout,

    // Compression errors
    CodecUnavailable,
    CompressionFailed,
    DecompressionFailed,
    SerializationFailed,
    DeserializationFailed,

    // Sync errors
    SyncFailed,
    TransportError,

    // Monitoring errors
    CollectionFailed,
    NoData
};

/**
 * @brief Convert Status to string
 */
inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::Success: return "Success";
        case Status::InvalidConfiguration: return "InvalidConfiguration";
        case Status::UnknownRule: return "UnknownRule";
        case Status::InvalidArgument: return "InvalidArgument";
        case Status::AlreadyRunning: return "AlreadyRunning";
        case Status::NotRunning: return "NotRunning";
        case Status::ShuttingDown: return "ShuttingDown";
        case Status::Timeout: return "Timeout";
        case Status::CodecUnavailable: return "CodecUnavailable";
        case Status::CompressionFailed: return "CompressionFailed";
        case Status::DecompressionFailed: return "DecompressionFailed";
        case Status::SerializationFailed: return "SerializationFailed";
        case Status::DeserializationFailed: return "DeserializationFailed";
        case Status::SyncFailed: return "SyncFailed";
        case Status::TransportError: return "TransportError";
        case Status::CollectionFailed: return "CollectionFailed";
        case Status::NoData: return "NoData";
        default: return "Unknown";
    }
}

/**
 * @brief Check whether a status represents success
 */
constexpr bool succeeded(Status status) noexcept {
    return status == Status::Success;
}

} // namespace crdtperf
