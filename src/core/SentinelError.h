// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// SentinelError.h - Error types for identity store operations
// C++23 std::expected-based error handling

#ifndef SENTINEL_ERROR_H
#define SENTINEL_ERROR_H

#include <expected>
#include <string>
#include <string_view>

namespace Sentinel {

// Error categories reported by the store, the slot engine and the backup codec
enum class SentinelError {
    // Identity operations
    RejectedInput,          // Empty name, empty or malformed secret, unknown tag
    NotFound,               // No identity with the requested id
    InvalidIndex,           // Vault slot index outside 0..9

    // Slot interaction
    NoSelection,            // Slot operation without a selected identity
    NotEditing,             // Commit/paste while no slot is being edited

    // Backup operations
    CorruptBackup,          // Backup text is not parseable structured data
    UnsupportedVersion,     // Store schema newer than this build understands
    ConfirmationRequired,   // Import attempted without caller confirmation

    // File operations
    FileNotFound,
    FileReadFailed,
    FileWriteFailed,
    FileTooLarge,

    // Data operations
    SerializationFailed,
    DeserializationFailed,

    // Cryptography
    CryptoError,

    // Generic
    UnknownError
};

// Convert error enum to human-readable string
inline constexpr std::string_view to_string(SentinelError error) noexcept {
    switch (error) {
        case SentinelError::RejectedInput:
            return "Rejected input";
        case SentinelError::NotFound:
            return "Identity not found";
        case SentinelError::InvalidIndex:
            return "Invalid vault slot index";
        case SentinelError::NoSelection:
            return "No identity selected";
        case SentinelError::NotEditing:
            return "No vault slot is being edited";
        case SentinelError::CorruptBackup:
            return "Corrupt backup file";
        case SentinelError::UnsupportedVersion:
            return "Unsupported store version";
        case SentinelError::ConfirmationRequired:
            return "Import requires confirmation";
        case SentinelError::FileNotFound:
            return "File not found";
        case SentinelError::FileReadFailed:
            return "Failed to read file";
        case SentinelError::FileWriteFailed:
            return "Failed to write file";
        case SentinelError::FileTooLarge:
            return "File is too large";
        case SentinelError::SerializationFailed:
            return "Failed to serialize data";
        case SentinelError::DeserializationFailed:
            return "Failed to deserialize data";
        case SentinelError::CryptoError:
            return "Cryptographic operation failed";
        case SentinelError::UnknownError:
            return "Unknown error occurred";
    }
    return "Unknown error";
}

// Helper type aliases
template<typename T = void>
using SentinelResult = std::expected<T, SentinelError>;

} // namespace Sentinel

#endif // SENTINEL_ERROR_H
