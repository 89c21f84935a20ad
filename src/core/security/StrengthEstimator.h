// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file StrengthEstimator.h
 * @brief Heuristic password strength scoring backed by zxcvbn
 *
 * Wraps the zxcvbn-c matcher (dictionary, keyboard adjacency, repeats,
 * sequences, dates) and turns its entropy estimate into the familiar
 * 0-4 score, a crack-time string and English feedback.
 *
 * @section scoring Scoring
 * guesses = 2^entropy, then:
 * | guesses        | score |
 * |----------------|-------|
 * | < 1e3 + 5      | 0     |
 * | < 1e6 + 5      | 1     |
 * | < 1e8 + 5      | 2     |
 * | < 1e10 + 5     | 3     |
 * | otherwise      | 4     |
 *
 * The crack time assumes offline slow hashing at 1e4 guesses per second.
 *
 * @section breach Breach Override
 * A breach signal always wins over the heuristic: apply_breach_signal()
 * forces score 0 and the "Breached" label whenever the count is non-zero.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Pulsar {

/**
 * @brief Exposure count reported by the breach checker
 *
 * 0 means "not found in the queried range", not "never breached".
 */
struct BreachSignal {
    uint64_t count = 0;

    [[nodiscard]] bool breached() const noexcept { return count > 0; }
};

/**
 * @brief Outcome of a strength check
 */
struct StrengthResult {
    static constexpr int UNSCORED = -1;

    int score = UNSCORED;                  ///< 0..4, or UNSCORED
    std::string warning;                   ///< Empty when nothing to warn about
    std::vector<std::string> suggestions;  ///< Ordered improvement hints
    std::string crack_time_display;        ///< e.g. "3 hours", "centuries"
    double entropy_bits = 0.0;             ///< log2(guesses)
    bool breached = false;                 ///< Set by apply_breach_signal()
};

class StrengthEstimator final {
public:
    /**
     * @brief Score a candidate password
     * @param candidate Password to score (UTF-8)
     * @param user_inputs Strings to treat as guessable (username, site, ...)
     * @return Result; UNSCORED with default suggestions for an empty candidate
     *         or when the matcher cannot run
     */
    [[nodiscard]] static StrengthResult check_strength(std::string_view candidate,
                                                       const std::vector<std::string>& user_inputs = {});

    /**
     * @brief Force the lowest tier when the candidate is known to be breached
     */
    [[nodiscard]] static StrengthResult apply_breach_signal(StrengthResult result, BreachSignal signal);

    /**
     * @brief Display label for a result ("Breached" overrides the score)
     */
    [[nodiscard]] static std::string_view label(const StrengthResult& result) noexcept;

    /**
     * @brief Display label for a bare score
     */
    [[nodiscard]] static std::string_view score_label(int score) noexcept;

    /**
     * @brief Map an entropy estimate (bits) to a 0-4 score
     */
    [[nodiscard]] static int score_from_entropy(double entropy_bits) noexcept;

    /**
     * @brief Human readable duration ("less than a second" ... "centuries")
     */
    [[nodiscard]] static std::string display_time(double seconds);

    /// Offline slow hashing scenario used for crack_time_display
    static constexpr double GUESSES_PER_SECOND = 1e4;

private:
    StrengthEstimator() = delete;
};

} // namespace Pulsar
