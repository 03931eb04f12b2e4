#pragma once

#include <string>

namespace hsync::core {

/**
 * @brief Failure categories surfaced by the sync core
 *
 * Validation          - malformed payload, rejected locally and never queued
 * TransientTransport  - network or server hiccup, retried with backoff
 * Timeout / Offline   - cycle cancelled before a response arrived
 * PermanentRejection  - server-side rule violation, straight to failed partition
 * StorageCorruption   - journal cannot be trusted, collection halted for sync
 */
enum class ErrorKind {
    Validation,
    NotFound,
    TransientTransport,
    Timeout,
    Offline,
    PermanentRejection,
    StorageCorruption,
    InvalidState,
    Busy
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidState;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::TransientTransport: return "transient_transport";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Offline: return "offline";
        case ErrorKind::PermanentRejection: return "permanent_rejection";
        case ErrorKind::StorageCorruption: return "storage_corruption";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::Busy: return "busy";
    }
    return "unknown";
}

inline Error validation_error(std::string message) {
    return Error(ErrorKind::Validation, std::move(message));
}

inline Error not_found(std::string message) {
    return Error(ErrorKind::NotFound, std::move(message));
}

inline Error storage_corruption(std::string message) {
    return Error(ErrorKind::StorageCorruption, std::move(message));
}

/// True for errors where the cycle never got an answer and must leave state untouched.
inline bool is_cancellation(const Error& error) {
    return error.kind == ErrorKind::Timeout || error.kind == ErrorKind::Offline;
}

} // namespace hsync::core
