// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file BreachChecker.h
 * @brief k-anonymity breach lookup against the Pwned Passwords range API
 *
 * The candidate is hashed with SHA-1 (the protocol of the range API),
 * hex-encoded in uppercase and split into a 5-character prefix and a
 * 35-character suffix. Only the prefix leaves the machine:
 *
 *     GET https://api.pwnedpasswords.com/range/{prefix}
 *
 * The body lists every known suffix for that prefix as `SUFFIX:COUNT`
 * lines; the count of the line whose suffix matches exactly is the result.
 *
 * @section fail_open Fail-Open Policy
 * check_breach() favors availability: any transport error, timeout, error
 * status or malformed body is logged and reported as 0 ("not found"), so an
 * outage of the external service never blocks generation. Each fail-open
 * event increments fail_open_count() and emits signal_fail_open() so a
 * sustained outage is visible. try_check_breach() returns the error instead.
 */

#pragma once

#include "HttpClient.h"
#include "../GeneratorError.h"
#include <sigc++/signal.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace Pulsar {

class BreachChecker {
public:
    static constexpr std::string_view RANGE_ENDPOINT = "https://api.pwnedpasswords.com/range/";
    static constexpr size_t PREFIX_LENGTH = 5;
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

    /**
     * @param client HTTP client (must outlive the checker)
     * @param timeout Bound on each range request
     */
    explicit BreachChecker(IHttpClient& client,
                           std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    // Non-copyable (holds a signal and a client reference)
    BreachChecker(const BreachChecker&) = delete;
    BreachChecker& operator=(const BreachChecker&) = delete;

    /**
     * @brief Exposure count for a candidate, 0 on any failure
     * @param candidate Plaintext password (never transmitted)
     * @return Count from the range response; 0 if absent, empty or failed
     */
    [[nodiscard]] uint64_t check_breach(std::string_view candidate);

    /**
     * @brief Exposure count, reporting failures
     * @return Count (0 when absent), or HashFailed / NetworkError / Timeout /
     *         HttpStatusError / InvalidResponse
     */
    [[nodiscard]] GeneratorResult<uint64_t> try_check_breach(std::string_view candidate);

    /**
     * @brief Uppercase hex SHA-1 of @p input (40 characters)
     */
    [[nodiscard]] static GeneratorResult<std::string> sha1_hex(std::string_view input);

    /**
     * @brief Find the count for @p suffix in a range response body
     * @return Count, 0 if the suffix is absent, InvalidResponse if the
     *         matching line has no valid count
     */
    [[nodiscard]] static GeneratorResult<uint64_t>
    parse_range_response(std::string_view body, std::string_view suffix);

    void set_timeout(std::chrono::milliseconds timeout) noexcept { m_timeout = timeout; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

    /// Number of checks that failed open since construction
    [[nodiscard]] uint64_t fail_open_count() const noexcept { return m_fail_open_count.load(); }

    /// Emitted with the underlying error each time a check fails open
    [[nodiscard]] sigc::signal<void(GeneratorError)>& signal_fail_open() noexcept { return m_signal_fail_open; }

private:
    IHttpClient& m_client;
    std::chrono::milliseconds m_timeout;
    std::atomic<uint64_t> m_fail_open_count{0};
    sigc::signal<void(GeneratorError)> m_signal_fail_open;
};

} // namespace Pulsar
