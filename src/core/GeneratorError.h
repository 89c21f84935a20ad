// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// GeneratorError.h - Error types for generator and security operations
// C++23 std::expected-based error handling

#ifndef PULSAR_GENERATOR_ERROR_H
#define PULSAR_GENERATOR_ERROR_H

#include <expected>
#include <string_view>

namespace Pulsar {

// Error types for secret generation, strength and breach checks
enum class GeneratorError {
    // Generation
    EmptyCharsetPool,
    InvalidLength,
    InvalidWordCount,
    RandomSourceFailed,

    // Word list
    WordListNotFound,
    WordListReadFailed,
    WordListEmpty,

    // Breach check
    HashFailed,
    NetworkError,
    Timeout,
    HttpStatusError,
    InvalidResponse,

    // Configuration
    SettingsUnavailable,
    InvalidPreset,

    // Generic
    UnknownError
};

// Convert error enum to human-readable string
inline constexpr std::string_view to_string(GeneratorError error) noexcept {
    switch (error) {
        case GeneratorError::EmptyCharsetPool:
            return "No characters available for the selected options";
        case GeneratorError::InvalidLength:
            return "Invalid password length";
        case GeneratorError::InvalidWordCount:
            return "Invalid passphrase word count";
        case GeneratorError::RandomSourceFailed:
            return "Secure random source failed";
        case GeneratorError::WordListNotFound:
            return "Word list file not found";
        case GeneratorError::WordListReadFailed:
            return "Failed to read word list";
        case GeneratorError::WordListEmpty:
            return "Word list contains no words";
        case GeneratorError::HashFailed:
            return "Failed to hash password";
        case GeneratorError::NetworkError:
            return "Network request failed";
        case GeneratorError::Timeout:
            return "Network request timed out";
        case GeneratorError::HttpStatusError:
            return "Breach service returned an error status";
        case GeneratorError::InvalidResponse:
            return "Breach service returned an invalid response";
        case GeneratorError::SettingsUnavailable:
            return "Settings schema is not installed";
        case GeneratorError::InvalidPreset:
            return "Invalid password preset";
        case GeneratorError::UnknownError:
            return "Unknown error occurred";
    }
    return "Unknown error";
}

// Helper type aliases
template<typename T = void>
using GeneratorResult = std::expected<T, GeneratorError>;

} // namespace Pulsar

#endif // PULSAR_GENERATOR_ERROR_H
