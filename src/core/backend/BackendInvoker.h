// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file BackendInvoker.h
 * @brief Retrying front door for vault backend commands
 *
 * Every request to the vault backend goes through call(), which applies one
 * policy for all commands:
 *
 * - Transient failures (message contains "busy", "timeout" or "locked",
 *   case-insensitive) are retried up to max_retries times with exponential
 *   backoff (base_delay, 2x, 4x, ...).
 * - Every failure is logged with its command and code.
 * - The final failure is announced through signal_user_error() so the UI can
 *   show it, except for probe commands (`is_*`, `check_*`) and user
 *   cancellations (message contains "cancel").
 * - The error is always returned to the caller as well.
 *
 * Payloads are opaque JSON text; the invoker never parses them.
 */

#pragma once

#include <sigc++/signal.h>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace Pulsar {

enum class BackendErrorCode : uint8_t {
    Database,
    VaultLocked,
    VaultNotLoaded,
    InvalidPassword,
    Validation,
    Internal,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(BackendErrorCode code) noexcept {
    switch (code) {
        case BackendErrorCode::Database:        return "Database";
        case BackendErrorCode::VaultLocked:     return "VaultLocked";
        case BackendErrorCode::VaultNotLoaded:  return "VaultNotLoaded";
        case BackendErrorCode::InvalidPassword: return "InvalidPassword";
        case BackendErrorCode::Validation:      return "Validation";
        case BackendErrorCode::Internal:        return "Internal";
        case BackendErrorCode::Unknown:         return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Structured error returned by the backend
 */
struct BackendError {
    BackendErrorCode code = BackendErrorCode::Unknown;
    std::string message;
};

template<typename T = std::string>
using BackendResult = std::expected<T, BackendError>;

/**
 * @brief Transport to the backend process (request/response)
 */
class IBackendTransport {
public:
    virtual ~IBackendTransport() = default;

    /**
     * @brief Send one command
     * @param command Command name (see BackendCommands.h)
     * @param args_json JSON object with the arguments
     * @return JSON result text or the backend's error
     */
    [[nodiscard]] virtual BackendResult<std::string>
    invoke(std::string_view command, std::string_view args_json) = 0;
};

class BackendInvoker {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr int DEFAULT_MAX_RETRIES = 3;
    /// Larger retry counts are clamped to this
    static constexpr int MAX_RETRIES = 10;
    static constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{100};

    /**
     * @param transport Backend transport (must outlive the invoker)
     * @param max_retries Retries after the first attempt for transient errors,
     *        clamped to [0, MAX_RETRIES]
     * @param base_delay Delay before the first retry; doubled for each further retry
     * @param sleeper Wait function (defaults to std::this_thread::sleep_for)
     */
    explicit BackendInvoker(IBackendTransport& transport,
                            int max_retries = DEFAULT_MAX_RETRIES,
                            std::chrono::milliseconds base_delay = DEFAULT_BASE_DELAY,
                            Sleeper sleeper = {});

    BackendInvoker(const BackendInvoker&) = delete;
    BackendInvoker& operator=(const BackendInvoker&) = delete;

    /**
     * @brief Invoke a command with the retry and notification policy
     * @param command Command name
     * @param args_json Arguments as a JSON object ("{}" when none)
     */
    [[nodiscard]] BackendResult<std::string> call(std::string_view command,
                                                  std::string_view args_json = "{}");

    /**
     * @brief Whether an error message describes a transient condition
     */
    [[nodiscard]] static bool is_transient(std::string_view message);

    /**
     * @brief Whether a failure of this command should stay out of the UI
     */
    [[nodiscard]] static bool is_silent(std::string_view command, std::string_view message);

    /// Emitted with the message of a failure the user should see
    [[nodiscard]] sigc::signal<void(const std::string&)>& signal_user_error() noexcept {
        return m_signal_user_error;
    }

private:
    IBackendTransport& m_transport;
    int m_max_retries;
    std::chrono::milliseconds m_base_delay;
    Sleeper m_sleeper;
    sigc::signal<void(const std::string&)> m_signal_user_error;
};

} // namespace Pulsar
